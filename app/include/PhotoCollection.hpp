#ifndef PHOTO_COLLECTION_HPP
#define PHOTO_COLLECTION_HPP

#include "BatchProcessor.hpp"
#include "Photo.hpp"
#include "Types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief The photos of one album and the state derived from naming them.
 *
 * The set of photos never changes after construction; loading another album
 * creates another collection. Row arguments are positions in that set.
 */
class PhotoCollection {
public:
    using AffixesListener = std::function<void(const SanitizedAffixes&)>;

    explicit PhotoCollection(std::vector<Photo> photos);

    PhotoStatus process_descriptions(const NamingConfig& config);

    /**
     * @brief Stores a user-typed description and validates it.
     *
     * The photo becomes customized and is skipped by later passes until
     * revert_customization() is called.
     */
    PhotoStatus apply_custom_description(std::size_t row, std::string text, const NamingConfig& config);
    PhotoStatus revert_customization(std::size_t row, const NamingConfig& config);

    void set_photo_status(std::size_t row, PhotoStatus status);
    void clear_all_statuses();

    bool is_execution_blocked() const { return execution_blocked; }

    // Called after every pass with the sanitized prefix, suffix and fallback.
    void set_affixes_listener(AffixesListener listener);
    const SanitizedAffixes& last_affixes() const { return last_result.affixes; }
    const BatchResult& last_batch_result() const { return last_result; }

    const Photo& at(std::size_t row) const;
    const std::vector<Photo>& photos() const { return photos_; }
    std::size_t size() const { return photos_.size(); }

    PhotoStatus validate_custom_description(std::size_t row, const std::string& text,
                                            const NamingConfig& config) const;

private:
    void check_row(std::size_t row) const;
    Photo& mutable_at(std::size_t row);
    bool has_duplicate(std::size_t row, const std::string& text) const;
    void check_data();

    std::vector<Photo> photos_;
    BatchProcessor processor;
    BatchResult last_result;
    AffixesListener affixes_listener;
    bool execution_blocked{false};
};

#endif
