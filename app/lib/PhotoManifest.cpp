#include "PhotoManifest.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>
#include <sstream>

namespace {
std::string string_member(const Json::Value& item, const char* key)
{
    const Json::Value& value = item[key];
    return value.isString() ? value.asString() : std::string();
}

std::vector<Photo> photos_from_array(const Json::Value& entries)
{
    auto logger = Logger::get_logger("core_logger");
    std::vector<Photo> photos;
    photos.reserve(entries.size());

    for (Json::ArrayIndex i = 0; i < entries.size(); ++i) {
        const Json::Value& item = entries[i];
        if (!item.isObject()) {
            if (logger) {
                logger->warn("Skipping manifest entry {}: not an object", i);
            }
            continue;
        }

        // Incomplete entries are skipped so one bad photo does not sink the album.
        if (!item["url"].isString() || !item["description"].isString() || !item["date"].isString()) {
            if (logger) {
                logger->warn("Skipping manifest entry {}: url, description or date missing", i);
            }
            continue;
        }
        std::string url = string_member(item, "url");
        if (url.empty()) {
            if (logger) {
                logger->warn("Skipping manifest entry {}: empty url", i);
            }
            continue;
        }
        photos.emplace_back(std::move(url), string_member(item, "description"), string_member(item, "date"));
    }
    return photos;
}
}

namespace PhotoManifest {

std::vector<Photo> parse(const std::string& json_text)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(json_text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_FORMAT, errors);
    }

    const Json::Value& entries = root.isObject() ? root["photos"] : root;
    if (!entries.isArray()) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_FORMAT, "Expected a \"photos\" array");
    }

    std::vector<Photo> photos = photos_from_array(entries);
    if (photos.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::NAMING_NO_PHOTOS,
                        std::to_string(entries.size()) + " manifest entries, none usable");
    }
    return photos;
}


std::vector<Photo> load(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_NOT_FOUND, "Manifest: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_OPEN_FAILED, "Manifest: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_READ_FAILED, "Manifest: " + path);
    }

    std::vector<Photo> photos = parse(buffer.str());
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded {} photo(s) from '{}'", photos.size(), path);
    }
    return photos;
}


std::string to_naming_plan_json(const std::vector<Photo>& photos,
                                const BatchResult& result,
                                bool execution_blocked)
{
    Json::Value root(Json::objectValue);
    root["worst_status"] = to_string(result.worst_status);
    root["execution_blocked"] = execution_blocked;
    root["index_width"] = result.index_width;

    Json::Value affixes(Json::objectValue);
    affixes["prefix"] = result.affixes.prefix;
    affixes["suffix"] = result.affixes.suffix;
    affixes["undescribed"] = result.affixes.undescribed;
    root["affixes"] = affixes;

    Json::Value entries(Json::arrayValue);
    for (const auto& photo : photos) {
        Json::Value entry(Json::objectValue);
        entry["url"] = photo.source_url();
        entry["date"] = photo.upload_date();
        entry["original_description"] = photo.original_description();
        entry["file_name"] = photo.description();
        entry["assigned_index"] = photo.assigned_index();
        entry["preferred_index"] = photo.preferred_index();
        entry["customized"] = photo.is_customized();
        entry["status"] = to_string(photo.status());
        entries.append(entry);
    }
    root["photos"] = entries;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, root);
}

}
