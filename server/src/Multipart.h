#pragma once
#include <optional>
#include <string>
#include <vector>

namespace BlackRoom {

    struct FormPart {
        std::string name;
        std::optional<std::string> filename;   // present for file fields
        std::string contentType;               // empty when the part declares none
        std::string body;
    };

    class MultipartForm {
    public:
        /// Parses a multipart/form-data body. Throws SchemaError when the header has no
        /// boundary or the body is not framed by it.
        static MultipartForm Parse(const std::string& contentTypeHeader, const std::string& body);

        const FormPart* Find(const std::string& name) const;
        std::optional<std::string> Field(const std::string& name) const;
        const std::vector<FormPart>& Parts() const { return m_Parts; }

    private:
        std::vector<FormPart> m_Parts;
    };

    /// Value of a `key=value` parameter in a header such as Content-Type or Content-Disposition.
    std::optional<std::string> HeaderParam(const std::string& header, const std::string& key);

} // namespace BlackRoom
