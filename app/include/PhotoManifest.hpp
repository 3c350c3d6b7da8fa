#ifndef PHOTO_MANIFEST_HPP
#define PHOTO_MANIFEST_HPP

#include "BatchProcessor.hpp"
#include "Photo.hpp"

#include <string>
#include <vector>

/**
 * @brief JSON exchange with the archive reader and the downloader.
 *
 * Input is either {"photos": [...]} or a bare array of objects carrying
 * "url", "description" and "date". Failures throw ErrorCodes::AppException.
 */
namespace PhotoManifest {

std::vector<Photo> load(const std::string& path);
std::vector<Photo> parse(const std::string& json_text);

/// Naming plan handed to the downloader: one entry per photo, in input order.
std::string to_naming_plan_json(const std::vector<Photo>& photos,
                                 const BatchResult& result,
                                 bool execution_blocked);

}

#endif
