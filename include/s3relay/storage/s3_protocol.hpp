#pragma once

#include "s3relay/storage/object_store.hpp"

#include <string>
#include <vector>

// Request bodies and response parsing for the S3 REST API. Kept apart from
// the transport so the XML handling can be exercised without a server.
namespace s3relay::s3 {

namespace xml {

// Find the value between <tag>value</tag>, returns empty string if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0);

struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // Position after closing tag
};

// Find all occurrences of <tag>...</tag> and return their content positions
std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag);

// Decode XML entities (basic set used by S3)
std::string decode_entities(const std::string& s);

std::string escape(const std::string& s);

} // namespace xml

// Build a service error from a non-2xx response. The <Error> document wins
// when present; otherwise the code is derived from the status.
StorageError parse_error_response(int status,
                                  const std::string& body,
                                  const net::HttpHeaders& headers);

BucketListResult parse_list_buckets(const std::string& body);

// ListObjectsV2 response
ListResult parse_list_objects(const std::string& body);

std::string build_complete_multipart_xml(const std::vector<CompletedPart>& parts);

std::string build_delete_objects_xml(const std::vector<std::string>& keys);

// Keys reported under <Error> in a DeleteObjects response
std::vector<std::string> parse_delete_errors(const std::string& body);

// Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag);

} // namespace s3relay::s3
