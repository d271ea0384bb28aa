#include "s3relay/storage/s3_protocol.hpp"

#include <sstream>

namespace s3relay::s3 {

namespace xml {

std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<ElementRange> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        ElementRange range;
        range.content_start = content_start;
        range.content_end = end;
        range.element_end = end + close_tag.length();
        results.push_back(range);

        pos = range.element_end;
    }

    return results;
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }  // Unknown entity, keep as-is
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

} // namespace xml

namespace {

std::string code_for_status(int status) {
    switch (status) {
        case 301: return "PermanentRedirect";
        case 400: return "BadRequest";
        case 403: return "AccessDenied";
        case 404: return "NotFound";
        case 409: return "Conflict";
        case 412: return "PreconditionFailed";
        case 416: return "InvalidRange";
        case 429: return "TooManyRequests";
        case 500: return "InternalError";
        case 503: return "ServiceUnavailable";
        default: return "HttpError";
    }
}

} // namespace

StorageError parse_error_response(int status,
                                  const std::string& body,
                                  const net::HttpHeaders& headers) {
    std::string code;
    std::string message;
    std::string request_id;

    std::string error_doc = xml::get_element(body, "Error");
    if (!error_doc.empty()) {
        code = xml::decode_entities(xml::get_element(error_doc, "Code"));
        message = xml::decode_entities(xml::get_element(error_doc, "Message"));
        request_id = xml::get_element(error_doc, "RequestId");
    }

    if (code.empty()) code = code_for_status(status);
    if (message.empty()) message = "HTTP " + std::to_string(status);
    if (request_id.empty()) request_id = headers.get("x-amz-request-id").value_or("");

    auto err = StorageError::service(status, code, message);
    err.request_id = request_id;
    return err;
}

BucketListResult parse_list_buckets(const std::string& body) {
    BucketListResult result;
    for (const auto& range : xml::find_elements(body, "Bucket")) {
        std::string content = body.substr(range.content_start,
                                          range.content_end - range.content_start);
        BucketInfo bucket;
        bucket.name = xml::decode_entities(xml::get_element(content, "Name"));
        bucket.creation_date = xml::get_element(content, "CreationDate");
        if (!bucket.name.empty()) {
            result.buckets.push_back(std::move(bucket));
        }
    }
    return result;
}

ListResult parse_list_objects(const std::string& body) {
    ListResult result;

    result.truncated = xml::get_element(body, "IsTruncated") == "true";
    result.next_continuation_token =
        xml::decode_entities(xml::get_element(body, "NextContinuationToken"));

    for (const auto& range : xml::find_elements(body, "Contents")) {
        std::string content = body.substr(range.content_start,
                                          range.content_end - range.content_start);
        ListEntry entry;
        entry.key = xml::decode_entities(xml::get_element(content, "Key"));

        std::string size_str = xml::get_element(content, "Size");
        if (!size_str.empty()) {
            try {
                entry.size = std::stoull(size_str);
            } catch (const std::exception&) {
                entry.size = 0;
            }
        }

        entry.last_modified = xml::get_element(content, "LastModified");
        entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
        entry.storage_class = xml::get_element(content, "StorageClass");
        result.objects.push_back(std::move(entry));
    }

    for (const auto& range : xml::find_elements(body, "CommonPrefixes")) {
        std::string content = body.substr(range.content_start,
                                          range.content_end - range.content_start);
        std::string prefix = xml::decode_entities(xml::get_element(content, "Prefix"));
        if (!prefix.empty()) {
            result.prefixes.push_back(std::move(prefix));
        }
    }

    return result;
}

std::string build_complete_multipart_xml(const std::vector<CompletedPart>& parts) {
    std::ostringstream doc;
    doc << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    doc << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    for (const auto& part : parts) {
        doc << "  <Part>\n";
        doc << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
        doc << "    <ETag>" << xml::escape(ensure_etag_quotes(part.etag)) << "</ETag>\n";
        doc << "  </Part>\n";
    }
    doc << "</CompleteMultipartUpload>";
    return doc.str();
}

std::string build_delete_objects_xml(const std::vector<std::string>& keys) {
    std::ostringstream doc;
    doc << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    doc << "<Delete xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    doc << "  <Quiet>true</Quiet>\n";
    for (const auto& key : keys) {
        doc << "  <Object><Key>" << xml::escape(key) << "</Key></Object>\n";
    }
    doc << "</Delete>";
    return doc.str();
}

std::vector<std::string> parse_delete_errors(const std::string& body) {
    std::vector<std::string> failed;
    for (const auto& range : xml::find_elements(body, "Error")) {
        std::string content = body.substr(range.content_start,
                                          range.content_end - range.content_start);
        std::string key = xml::decode_entities(xml::get_element(content, "Key"));
        if (!key.empty()) {
            failed.push_back(std::move(key));
        }
    }
    return failed;
}

std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

} // namespace s3relay::s3
