#include "Errors.h"
#include "Multipart.h"

#include <cassert>
#include <iostream>
#include <string>

namespace {

    using BlackRoom::HeaderParam;
    using BlackRoom::MultipartForm;
    using BlackRoom::SchemaError;

    const std::string kBinary = std::string("\0\x01\r\n-", 5) + "tail";

    std::string SampleBody() {
        return "--XyZ\r\n"
            "Content-Disposition: form-data; name=\"room\"\r\n"
            "\r\n"
            "beta\r\n"
            "--XyZ\r\n"
            "Content-Disposition: form-data; name=\"file\"; filename=\"a b;c.ogg\"\r\n"
            "Content-Type: audio/ogg\r\n"
            "\r\n"
            + kBinary + "\r\n"
            "--XyZ--\r\n";
    }

    bool ThrowsSchemaError(const std::string& contentType, const std::string& body) {
        try {
            MultipartForm::Parse(contentType, body);
        }
        catch (const SchemaError&) {
            return true;
        }
        return false;
    }

    void TestParsesFieldsAndFiles() {
        const auto form = MultipartForm::Parse("multipart/form-data; boundary=XyZ", SampleBody());
        assert(form.Parts().size() == 2);
        assert(form.Field("room") == std::string("beta"));

        const auto* file = form.Find("file");
        assert(file != nullptr);
        assert(file->filename == std::string("a b;c.ogg"));
        assert(file->contentType == "audio/ogg");
        assert(file->body == kBinary);

        const auto* room = form.Find("room");
        assert(room && !room->filename && room->contentType.empty());
        assert(form.Find("missing") == nullptr);
        assert(!form.Field("missing").has_value());
    }

    void TestQuotedBoundaryAndCase() {
        const auto form = MultipartForm::Parse("Multipart/Form-Data; BOUNDARY=\"XyZ\"", SampleBody());
        assert(form.Parts().size() == 2);
    }

    void TestRejectsMalformed() {
        assert(ThrowsSchemaError("application/json", SampleBody()));
        assert(ThrowsSchemaError("multipart/form-data", SampleBody()));
        assert(ThrowsSchemaError("multipart/form-data; boundary=other", SampleBody()));
        assert(ThrowsSchemaError("multipart/form-data; boundary=XyZ",
            "--XyZ\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\nno closing delimiter"));
    }

    void TestHeaderParam() {
        assert(HeaderParam("form-data; name=\"x\"; filename=\"semi;colon.txt\"", "filename") == std::string("semi;colon.txt"));
        assert(HeaderParam("form-data; name=plain", "name") == std::string("plain"));
        assert(HeaderParam("form-data; NAME=\"x\"", "name") == std::string("x"));
        assert(!HeaderParam("form-data; name=\"x\"", "filename").has_value());
    }

} // namespace

int main() {
    TestParsesFieldsAndFiles();
    TestQuotedBoundaryAndCase();
    TestRejectsMalformed();
    TestHeaderParam();

    std::cout << "blackroom_unit_multipart: pass\n";
    return 0;
}
