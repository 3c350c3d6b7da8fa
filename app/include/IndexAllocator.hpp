#ifndef INDEX_ALLOCATOR_HPP
#define INDEX_ALLOCATOR_HPP

#include "Photo.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Assigns sequential indexes to photos that share a description.
 *
 * Photos are grouped by case-insensitive description. Within a group every
 * photo receives a distinct index in [1, group size], honoring the photo's
 * preferred index where it does not collide with an earlier registrant or
 * with a gap that has to be filled. Indexes are appended to the description
 * as " - NN" (or " - NNN" for three-digit width).
 *
 * All photos must be registered before append_all_indexes() runs. The
 * allocator does not own the photos; they must outlive it.
 */
class IndexAllocator {
public:
    explicit IndexAllocator(int index_width);

    void register_photo(Photo& photo);
    void append_all_indexes(bool index_unique);

    std::size_t group_count() const { return groups.size(); }

    static std::string format_index(int index, int width);

private:
    struct DescriptionGroup {
        std::map<int, Photo*> with_preference;
        std::vector<Photo*> no_preference;

        void add(Photo& photo);
        std::size_t size() const { return with_preference.size() + no_preference.size(); }
    };

    void append_group_indexes(DescriptionGroup& group, bool index_unique) const;
    void assign(Photo& photo, int index) const;

    int width;
    std::map<std::string, DescriptionGroup> groups;
};

#endif
