#include "Multipart.h"
#include "Errors.h"
#include <algorithm>
#include <cctype>

namespace {

    std::string Trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    bool IEquals(const std::string& a, const std::string& b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
    }

    // Splits on ';' outside of double quotes.
    std::vector<std::string> SplitParams(const std::string& header) {
        std::vector<std::string> out;
        std::string cur;
        bool quoted = false;
        for (size_t i = 0; i < header.size(); ++i) {
            const char c = header[i];
            if (c == '"') quoted = !quoted;
            if (c == '\\' && quoted && i + 1 < header.size()) {
                cur += c;
                cur += header[++i];
                continue;
            }
            if (c == ';' && !quoted) {
                out.push_back(cur);
                cur.clear();
                continue;
            }
            cur += c;
        }
        out.push_back(cur);
        return out;
    }

    std::string Unquote(const std::string& v) {
        if (v.size() < 2 || v.front() != '"' || v.back() != '"') return v;
        std::string out;
        for (size_t i = 1; i + 1 < v.size(); ++i) {
            if (v[i] == '\\' && i + 2 < v.size()) ++i;
            out += v[i];
        }
        return out;
    }

} // namespace

namespace BlackRoom {

    std::optional<std::string> HeaderParam(const std::string& header, const std::string& key) {
        const auto params = SplitParams(header);
        for (size_t i = 1; i < params.size(); ++i) {
            const auto eq = params[i].find('=');
            if (eq == std::string::npos) continue;
            if (IEquals(Trim(params[i].substr(0, eq)), key))
                return Unquote(Trim(params[i].substr(eq + 1)));
        }
        return std::nullopt;
    }

    MultipartForm MultipartForm::Parse(const std::string& contentTypeHeader, const std::string& body) {
        const std::string mediaType = Trim(contentTypeHeader.substr(0, contentTypeHeader.find(';')));
        if (!IEquals(mediaType, "multipart/form-data"))
            throw SchemaError("expected multipart/form-data");
        const auto boundary = HeaderParam(contentTypeHeader, "boundary");
        if (!boundary || boundary->empty())
            throw SchemaError("multipart boundary missing");

        const std::string delimiter = "--" + *boundary;
        const std::string partDelimiter = "\r\n" + delimiter;

        MultipartForm form;
        size_t pos = body.find(delimiter);
        if (pos == std::string::npos) throw SchemaError("multipart body has no boundary");
        pos += delimiter.size();

        while (true) {
            if (body.compare(pos, 2, "--") == 0) break;    // closing delimiter
            if (body.compare(pos, 2, "\r\n") != 0) throw SchemaError("malformed multipart delimiter");
            pos += 2;

            const size_t headerEnd = body.find("\r\n\r\n", pos);
            if (headerEnd == std::string::npos) throw SchemaError("unterminated multipart headers");

            FormPart part;
            size_t lineStart = pos;
            while (lineStart < headerEnd) {
                size_t lineEnd = body.find("\r\n", lineStart);
                if (lineEnd == std::string::npos || lineEnd > headerEnd) lineEnd = headerEnd;
                const std::string line = body.substr(lineStart, lineEnd - lineStart);
                lineStart = lineEnd + 2;

                const auto colon = line.find(':');
                if (colon == std::string::npos) continue;
                const std::string name = Trim(line.substr(0, colon));
                const std::string value = Trim(line.substr(colon + 1));
                if (IEquals(name, "Content-Disposition")) {
                    part.name = HeaderParam(value, "name").value_or("");
                    part.filename = HeaderParam(value, "filename");
                }
                else if (IEquals(name, "Content-Type")) {
                    part.contentType = value;
                }
            }

            const size_t bodyStart = headerEnd + 4;
            const size_t bodyEnd = body.find(partDelimiter, bodyStart);
            if (bodyEnd == std::string::npos) throw SchemaError("unterminated multipart part");
            part.body = body.substr(bodyStart, bodyEnd - bodyStart);
            form.m_Parts.push_back(std::move(part));
            pos = bodyEnd + partDelimiter.size();
        }
        return form;
    }

    const FormPart* MultipartForm::Find(const std::string& name) const {
        for (const auto& p : m_Parts)
            if (p.name == name) return &p;
        return nullptr;
    }

    std::optional<std::string> MultipartForm::Field(const std::string& name) const {
        const FormPart* p = Find(name);
        if (!p) return std::nullopt;
        return p->body;
    }

} // namespace BlackRoom
