#pragma once

#include <string>

namespace cvdr::upload {

/**
 * @brief multipart/form-data framing, emitted piece by piece
 *
 * Only the framing is produced here; file contents are written between
 * file_header() and the next part (or closing()) by the caller, which keeps
 * large parts out of memory.
 */
class MultipartEncoder {
public:
    MultipartEncoder();
    explicit MultipartEncoder(std::string boundary);

    const std::string& boundary() const noexcept { return boundary_; }

    /// "multipart/form-data; boundary=..."
    std::string content_type() const;

    /// Complete part for a simple form field
    std::string field(const std::string& name, const std::string& value);

    /// Headers of a file part; the file bytes follow
    std::string file_header(const std::string& field_name, const std::string& filename);

    /// Final boundary
    std::string closing() const;

private:
    std::string delimiter();

    std::string boundary_;
    bool first_part_ = true;
};

} // namespace cvdr::upload
