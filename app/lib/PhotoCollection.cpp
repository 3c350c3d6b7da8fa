#include "PhotoCollection.hpp"
#include "AppException.hpp"
#include "FilenameSanitizer.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <utility>


PhotoCollection::PhotoCollection(std::vector<Photo> photos)
    : photos_(std::move(photos))
{
}


void PhotoCollection::check_row(std::size_t row) const
{
    if (row >= photos_.size()) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                        "Photo row " + std::to_string(row) + " of " + std::to_string(photos_.size()));
    }
}


const Photo& PhotoCollection::at(std::size_t row) const
{
    check_row(row);
    return photos_[row];
}


Photo& PhotoCollection::mutable_at(std::size_t row)
{
    check_row(row);
    return photos_[row];
}


void PhotoCollection::set_affixes_listener(AffixesListener listener)
{
    affixes_listener = std::move(listener);
}


PhotoStatus PhotoCollection::process_descriptions(const NamingConfig& config)
{
    last_result = processor.process(photos_, config);
    check_data();
    if (affixes_listener) {
        affixes_listener(last_result.affixes);
    }
    return last_result.worst_status;
}


bool PhotoCollection::has_duplicate(std::size_t row, const std::string& text) const
{
    const std::string needle = FilenameSanitizer::fold_case(text);
    for (std::size_t i = 0; i < photos_.size(); ++i) {
        if (i == row) {
            continue;
        }
        if (FilenameSanitizer::fold_case(photos_[i].description()) == needle) {
            return true;
        }
    }
    return false;
}


PhotoStatus PhotoCollection::validate_custom_description(std::size_t row,
                                                         const std::string& text,
                                                         const NamingConfig& config) const
{
    const int length = FilenameSanitizer::length(text);
    PhotoStatus status = PhotoStatus::Ready;

    if (length > kOsMaxPath || length < kMinimumPath) {
        status = PhotoStatus::RefuseLength;
    } else if (length > config.length_limit()) {
        if (config.over_length == OverlengthBehavior::Refuse) {
            status = PhotoStatus::RefuseLength;
        } else if (config.over_length != OverlengthBehavior::DoNothing) {
            status = PhotoStatus::WarningLength;
        }
    }

    if (FilenameSanitizer::contains_invalid_character(text)) {
        status = worst(status, PhotoStatus::RefuseSymbol);
    }
    if (has_duplicate(row, text)) {
        status = worst(status, PhotoStatus::RefuseDuplicate);
    }
    return status;
}


PhotoStatus PhotoCollection::apply_custom_description(std::size_t row,
                                                      std::string text,
                                                      const NamingConfig& config)
{
    const PhotoStatus status = validate_custom_description(row, text, config);

    Photo& photo = mutable_at(row);
    photo.set_description(std::move(text));
    photo.set_customized(true);
    photo.set_assigned_index(-1);
    photo.set_status(status);
    check_data();

    if (auto logger = Logger::get_logger("ui_logger")) {
        logger->debug("Row {} customized to '{}' ({})", row, photo.description(), to_string(status));
    }
    return status;
}


PhotoStatus PhotoCollection::revert_customization(std::size_t row, const NamingConfig& config)
{
    mutable_at(row).set_customized(false);
    return process_descriptions(config);
}


void PhotoCollection::set_photo_status(std::size_t row, PhotoStatus status)
{
    mutable_at(row).set_status(status);
    check_data();
}


void PhotoCollection::clear_all_statuses()
{
    for (auto& photo : photos_) {
        photo.set_status(PhotoStatus::Ready);
    }
    check_data();
}


void PhotoCollection::check_data()
{
    execution_blocked = std::any_of(photos_.begin(), photos_.end(), [](const Photo& photo) {
        return is_at_least_as_bad_as(photo.status(), PhotoStatus::ErrorMinor);
    });
}
