#include "BatchProcessor.hpp"
#include "DescriptionNormalizer.hpp"
#include "IndexAllocator.hpp"
#include "Logger.hpp"


int BatchProcessor::index_width_for(std::size_t batch_size)
{
    return batch_size >= 100 ? 3 : 2;
}


BatchResult BatchProcessor::process(std::vector<Photo>& photos, const NamingConfig& config) const
{
    BatchResult result;
    result.index_width = index_width_for(photos.size());

    const DescriptionNormalizer normalizer(config, photos.size());
    IndexAllocator allocator(result.index_width);
    result.affixes = normalizer.affixes();

    for (auto& photo : photos) {
        if (!normalizer.normalize(photo)) {
            ++result.customized_count;
            continue;
        }
        allocator.register_photo(photo);
        ++result.normalized_count;
    }
    allocator.append_all_indexes(config.index_unique);

    for (const auto& photo : photos) {
        result.worst_status = worst(result.worst_status, photo.status());
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Named {} photo(s) in {} group(s), {} customized, index width {}, worst status {}",
                      result.normalized_count, allocator.group_count(), result.customized_count,
                      result.index_width, to_string(result.worst_status));
    }
    return result;
}
