#include "cvdr/upload/multipart.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace cvdr::upload {
namespace {

std::string random_boundary() {
    std::random_device device;
    std::uniform_int_distribution<int> dist(0, 255);
    std::ostringstream oss;
    for (int i = 0; i < 30; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << dist(device);
    }
    return oss.str();
}

std::string escape_quotes(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

MultipartEncoder::MultipartEncoder() : boundary_(random_boundary()) {}

MultipartEncoder::MultipartEncoder(std::string boundary) : boundary_(std::move(boundary)) {}

std::string MultipartEncoder::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartEncoder::delimiter() {
    std::string out = first_part_ ? "--" : "\r\n--";
    first_part_ = false;
    return out + boundary_ + "\r\n";
}

std::string MultipartEncoder::field(const std::string& name, const std::string& value) {
    return delimiter() +
           "Content-Disposition: form-data; name=\"" + escape_quotes(name) + "\"\r\n\r\n" +
           value;
}

std::string MultipartEncoder::file_header(const std::string& field_name, const std::string& filename) {
    return delimiter() +
           "Content-Disposition: form-data; name=\"" + escape_quotes(field_name) +
           "\"; filename=\"" + escape_quotes(filename) + "\"\r\n" +
           "Content-Type: application/octet-stream\r\n\r\n";
}

std::string MultipartEncoder::closing() const {
    return (first_part_ ? "--" : "\r\n--") + boundary_ + "--\r\n";
}

} // namespace cvdr::upload
