#include "stmeta/api.hpp"

#include "stmeta/safetensors.hpp"

namespace stmeta::api {

Json file_info_to_json(const FileInfo& f) {
    Json j = Json::object();
    j.set("name", Json::string(f.name));
    j.set("size", Json::unsigned_integer(f.size));
    j.set("modified", Json::number(f.modified));
    j.set("path", Json::string(f.path));
    j.set("relative_path", Json::string(f.relative_path));
    j.set("format", Json::string(to_string(f.format)));
    return j;
}

Json file_list_to_json(const std::vector<FileInfo>& files, const std::filesystem::path& directory) {
    Json::Array arr;
    arr.reserve(files.size());
    for (const auto& f : files) arr.push_back(file_info_to_json(f));

    Json j = Json::object();
    j.set("files", Json::array(std::move(arr)));
    j.set("total", Json::unsigned_integer(files.size()));
    j.set("directory", Json::string(directory.string()));
    return j;
}

Json report_to_json(const MetadataReport& r) {
    Json j = Json::object();
    j.set("file", file_info_to_json(r.file));
    j.set("header_length", Json::unsigned_integer(r.header_length));
    j.set("payload_offset", Json::unsigned_integer(r.payload_offset));
    j.set("tensor_count", Json::unsigned_integer(r.tensor_count));
    if (r.payload_crc32) {
        j.set("payload_crc32", Json::string(hex8(*r.payload_crc32)));
    }
    if (r.metadata) {
        j.set("metadata", r.metadata->metadata_json());
        j.set("formatted_metadata", r.metadata->formatted_json());
    } else {
        j.set("metadata", Json::null());
        j.set("formatted_metadata", Json::null());
    }
    return j;
}

Json server_info_to_json(const LibraryConfig& cfg) {
    Json::Array formats;
    for (const auto& ext : cfg.extensions) formats.push_back(Json::string(ext));

    Json j = Json::object();
    j.set("files_directory", Json::string(cfg.root.string()));
    j.set("server_mode", Json::boolean(true));
    j.set("supported_formats", Json::array(std::move(formats)));
    return j;
}

Json error_to_json(const std::string& message, ErrorKind kind) {
    Json j = Json::object();
    j.set("error", Json::string(message));
    j.set("kind", Json::string(to_string(kind)));
    return j;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
        case ErrorKind::NoMetadata:
            return 404;
        case ErrorKind::AccessDenied:
            return 403;
        case ErrorKind::InvalidJson:
        case ErrorKind::SerializationError:
            return 400;
        case ErrorKind::TruncatedInput:
        case ErrorKind::InvalidEncoding:
        case ErrorKind::MalformedHeader:
        case ErrorKind::Unsupported:
            return 422;
        case ErrorKind::Io:
        case ErrorKind::VerificationFailed:
            return 500;
    }
    return 500;
}

Json::Object metadata_from_request(const std::string& body) {
    Json j = parse_json(body);
    if (!j.is_object()) {
        throw StmetaError(ErrorKind::InvalidJson, "request body must be a JSON object");
    }
    const auto& obj = j.as_object();
    if (obj.size() == 1 && obj.front().first == "metadata" && obj.front().second.is_object()) {
        return obj.front().second.as_object();
    }
    return obj;
}

} // namespace stmeta::api
