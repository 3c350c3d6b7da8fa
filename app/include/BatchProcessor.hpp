#ifndef BATCH_PROCESSOR_HPP
#define BATCH_PROCESSOR_HPP

#include "Photo.hpp"
#include "Types.hpp"

#include <cstddef>
#include <vector>

struct BatchResult {
    PhotoStatus worst_status{PhotoStatus::Ready};
    SanitizedAffixes affixes;
    int index_width{2};
    std::size_t normalized_count{0};
    std::size_t customized_count{0};
};

/**
 * @brief Runs one naming pass over an album's photos.
 *
 * Every non-customized photo is recomputed from its original description,
 * so calling process() again with the same configuration yields the same
 * names and statuses.
 */
class BatchProcessor {
public:
    BatchResult process(std::vector<Photo>& photos, const NamingConfig& config) const;

    /// Digits used for zero-padding indexes: 2 below 100 photos, else 3.
    static int index_width_for(std::size_t batch_size);
};

#endif
