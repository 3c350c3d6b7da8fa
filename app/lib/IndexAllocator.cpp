#include "IndexAllocator.hpp"
#include "FilenameSanitizer.hpp"

#include <spdlog/fmt/fmt.h>


IndexAllocator::IndexAllocator(int index_width)
    : width(index_width)
{
}


std::string IndexAllocator::format_index(int index, int width)
{
    return fmt::format(" - {:0{}d}", index, width);
}


void IndexAllocator::DescriptionGroup::add(Photo& photo)
{
    const int preferred = photo.preferred_index();
    if (preferred >= 0 && with_preference.emplace(preferred, &photo).second) {
        return;
    }
    // No preference, or the first registrant already holds it.
    no_preference.push_back(&photo);
}


void IndexAllocator::register_photo(Photo& photo)
{
    groups[FilenameSanitizer::fold_case(photo.description())].add(photo);
}


void IndexAllocator::append_all_indexes(bool index_unique)
{
    for (auto& [key, group] : groups) {
        append_group_indexes(group, index_unique);
    }
}


void IndexAllocator::assign(Photo& photo, int index) const
{
    photo.append_to_description(format_index(index, width));
    photo.set_assigned_index(index);
}


void IndexAllocator::append_group_indexes(DescriptionGroup& group, bool index_unique) const
{
    const int total = static_cast<int>(group.size());
    if (!index_unique && total == 1) {
        return;
    }

    // Phase 1: preferred photos take their own slot, the others fill the gaps
    // in registration order. Ends once the gap fillers run out.
    int current = 1;
    std::size_t next_unpreferred = 0;
    while (current <= total) {
        const auto preferred = group.with_preference.find(current);
        if (preferred != group.with_preference.end()) {
            assign(*preferred->second, current);
        } else if (next_unpreferred < group.no_preference.size()) {
            assign(*group.no_preference[next_unpreferred++], current);
        } else {
            break;
        }
        ++current;
    }

    // Phase 2: remaining preferred photos, in preference order, take the
    // following indexes. Preferences in [1, phase_one_end) were honored above
    // and nobody prefers phase_one_end itself, or phase 1 would have continued.
    const int phase_one_end = current;
    for (auto& [preferred, photo] : group.with_preference) {
        if (current > total) {
            break;
        }
        if (preferred >= 1 && preferred < phase_one_end) {
            continue;
        }
        assign(*photo, current++);
    }
}
