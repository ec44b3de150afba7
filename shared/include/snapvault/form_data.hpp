/**
 * SnapVault - multipart/form-data framing used by the restore upload.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snapvault::protocol
{

    struct FormPart
    {
        std::string name;
        std::optional<std::string> filename{};
        std::string content_type{};
        std::string data{};
    };

    struct FormData
    {
        std::vector<FormPart> parts;

        const FormPart *find(std::string_view name) const;
        std::optional<std::string> field(std::string_view name) const;
    };

    std::optional<std::string> boundary_from_content_type(std::string_view content_type);

    std::string form_content_type(std::string_view boundary);

    std::string make_boundary();

    std::string encode_form_data(std::string_view boundary, const std::vector<FormPart> &parts);

    // Throws TransferError(InvalidRequest) on malformed bodies.
    FormData decode_form_data(std::string_view content_type, std::string_view body);

} // namespace snapvault::protocol
