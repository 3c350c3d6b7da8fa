#ifndef PHOTO_HPP
#define PHOTO_HPP

#include "Types.hpp"

#include <string>

/**
 * @brief A photo of a saved album page and its working file name.
 *
 * The source URL, original description, upload date and preferred index are
 * fixed at construction. The working description and status are rewritten by
 * every processing pass unless the user customized the description.
 */
class Photo {
public:
    /// Larger trailing numbers are not treated as index preferences.
    static constexpr int kMaxPreferredIndex = 299;

    Photo(std::string source_url, std::string original_description, std::string upload_date);

    const std::string& source_url() const { return source_url_; }
    const std::string& original_description() const { return original_description_; }
    const std::string& upload_date() const { return upload_date_; }
    int preferred_index() const { return preferred_index_; }

    PhotoStatus status() const { return status_; }
    void set_status(PhotoStatus status) { status_ = status; }

    const std::string& description() const { return description_; }
    void set_description(std::string description);
    void append_to_description(const std::string& text) { description_ += text; }

    bool is_customized() const { return customized_; }
    void set_customized(bool customized) { customized_ = customized; }

    // Index appended by the last allocation, or -1 when none was appended.
    int assigned_index() const { return assigned_index_; }
    void set_assigned_index(int index) { assigned_index_ = index; }

    /**
     * @brief Extracts the index hint from a description.
     *
     * A trailing "(N)" wins over trailing bare digits. Returns -1 when there
     * is no trailing number or it exceeds kMaxPreferredIndex.
     */
    static int parse_preferred_index(const std::string& description);

private:
    std::string source_url_;
    std::string original_description_;
    std::string upload_date_;
    int preferred_index_{-1};

    PhotoStatus status_{PhotoStatus::Ready};
    std::string description_;
    bool customized_{false};
    int assigned_index_{-1};
};

#endif
