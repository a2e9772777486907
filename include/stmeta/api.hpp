#pragma once

#include "stmeta/error.hpp"
#include "stmeta/json.hpp"
#include "stmeta/library.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace stmeta::api {

// JSON bodies exchanged with the browser client. Kept free of any HTTP types.

Json file_info_to_json(const FileInfo& f);
Json file_list_to_json(const std::vector<FileInfo>& files, const std::filesystem::path& directory);
Json report_to_json(const MetadataReport& r);
Json server_info_to_json(const LibraryConfig& cfg);
Json error_to_json(const std::string& message, ErrorKind kind);

/// Status code reported for an error kind.
int http_status_for(ErrorKind kind);

/// Accepts either the metadata object itself or {"metadata": {...}}.
/// Throws StmetaError(InvalidJson) when the body is not a JSON object.
Json::Object metadata_from_request(const std::string& body);

} // namespace stmeta::api
