#include "snapvault/form_data.hpp"

#include <algorithm>
#include <cctype>

#include "snapvault/crypto.hpp"
#include "snapvault/error_codes.hpp"

namespace snapvault::protocol
{

    namespace
    {
        constexpr std::string_view kCrlf = "\r\n";
        constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

        [[noreturn]] void malformed(const std::string &what)
        {
            throw TransferError(ErrorCode::InvalidRequest, "Malformed multipart body: " + what);
        }

        std::string lowercase(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::string unquote(std::string_view value)
        {
            value = trim(value);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }

        // form-data; name="field"; filename="file.zip"
        void apply_disposition(std::string_view value, FormPart &part)
        {
            std::size_t pos = 0;
            while (pos <= value.size())
            {
                auto next = value.find(';', pos);
                if (next == std::string_view::npos)
                {
                    next = value.size();
                }
                const auto token = trim(value.substr(pos, next - pos));
                const auto eq = token.find('=');
                if (eq != std::string_view::npos)
                {
                    const auto key = lowercase(trim(token.substr(0, eq)));
                    auto param = unquote(token.substr(eq + 1));
                    if (key == "name")
                    {
                        part.name = std::move(param);
                    }
                    else if (key == "filename")
                    {
                        part.filename = std::move(param);
                    }
                }
                pos = next + 1;
            }
        }

        void apply_headers(std::string_view headers, FormPart &part)
        {
            std::size_t pos = 0;
            while (pos < headers.size())
            {
                auto line_end = headers.find(kCrlf, pos);
                if (line_end == std::string_view::npos)
                {
                    line_end = headers.size();
                }
                const auto line = headers.substr(pos, line_end - pos);
                const auto colon = line.find(':');
                if (colon != std::string_view::npos)
                {
                    const auto name = lowercase(trim(line.substr(0, colon)));
                    const auto value = trim(line.substr(colon + 1));
                    if (name == "content-disposition")
                    {
                        apply_disposition(value, part);
                    }
                    else if (name == "content-type")
                    {
                        part.content_type = std::string(value);
                    }
                }
                pos = line_end + kCrlf.size();
            }
        }

    } // namespace

    const FormPart *FormData::find(std::string_view name) const
    {
        const auto it = std::find_if(parts.begin(), parts.end(), [&](const FormPart &part)
                                     { return part.name == name; });
        return it == parts.end() ? nullptr : &*it;
    }

    std::optional<std::string> FormData::field(std::string_view name) const
    {
        const auto *part = find(name);
        if (part == nullptr)
        {
            return std::nullopt;
        }
        return part->data;
    }

    std::optional<std::string> boundary_from_content_type(std::string_view content_type)
    {
        const auto lowered = lowercase(content_type);
        if (lowered.find("multipart/form-data") == std::string::npos)
        {
            return std::nullopt;
        }
        const auto key = lowered.find("boundary=");
        if (key == std::string::npos)
        {
            return std::nullopt;
        }
        auto value = content_type.substr(key + 9);
        const auto semicolon = value.find(';');
        if (semicolon != std::string_view::npos)
        {
            value = value.substr(0, semicolon);
        }
        auto boundary = unquote(value);
        if (boundary.empty() || boundary.size() > 70)
        {
            return std::nullopt;
        }
        return boundary;
    }

    std::string form_content_type(std::string_view boundary)
    {
        return "multipart/form-data; boundary=" + std::string(boundary);
    }

    std::string make_boundary()
    {
        return "----snapvault" + crypto::random_identifier();
    }

    std::string encode_form_data(std::string_view boundary, const std::vector<FormPart> &parts)
    {
        std::string body;
        for (const auto &part : parts)
        {
            body.append("--").append(boundary).append(kCrlf);
            body.append("Content-Disposition: form-data; name=\"").append(part.name).append("\"");
            if (part.filename)
            {
                body.append("; filename=\"").append(*part.filename).append("\"");
            }
            body.append(kCrlf);
            if (!part.content_type.empty())
            {
                body.append("Content-Type: ").append(part.content_type).append(kCrlf);
            }
            body.append(kCrlf);
            body.append(part.data);
            body.append(kCrlf);
        }
        body.append("--").append(boundary).append("--").append(kCrlf);
        return body;
    }

    FormData decode_form_data(std::string_view content_type, std::string_view body)
    {
        const auto boundary = boundary_from_content_type(content_type);
        if (!boundary)
        {
            throw TransferError(ErrorCode::InvalidRequest, "Expected multipart/form-data with a boundary");
        }
        const std::string delimiter = "--" + *boundary;
        const std::string separator = std::string(kCrlf) + delimiter;

        FormData form;
        auto pos = body.find(delimiter);
        if (pos == std::string_view::npos)
        {
            malformed("missing opening boundary");
        }
        pos += delimiter.size();

        while (true)
        {
            if (body.substr(pos, 2) == "--")
            {
                break;
            }
            while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t'))
            {
                ++pos;
            }
            if (body.substr(pos, kCrlf.size()) != kCrlf)
            {
                malformed("boundary not followed by a line break");
            }
            pos += kCrlf.size();

            FormPart part;
            std::size_t content_begin = 0;
            if (body.substr(pos, kCrlf.size()) == kCrlf)
            {
                content_begin = pos + kCrlf.size();
            }
            else
            {
                const auto header_end = body.find(kHeaderTerminator, pos);
                if (header_end == std::string_view::npos)
                {
                    malformed("unterminated part headers");
                }
                apply_headers(body.substr(pos, header_end - pos), part);
                content_begin = header_end + kHeaderTerminator.size();
            }

            const auto content_end = body.find(separator, content_begin);
            if (content_end == std::string_view::npos)
            {
                malformed("missing closing boundary");
            }
            part.data = std::string(body.substr(content_begin, content_end - content_begin));
            if (!part.name.empty())
            {
                form.parts.push_back(std::move(part));
            }
            pos = content_end + separator.size();
        }
        return form;
    }

} // namespace snapvault::protocol
