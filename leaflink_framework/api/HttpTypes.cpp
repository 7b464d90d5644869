#include "api/HttpTypes.hpp"
#include "core/LeafError.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t");
    if(begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

std::string decodeChunked(const std::string& payload) {
    std::string body;
    size_t pos = 0;
    while(true) {
        auto lineEnd = payload.find("\r\n", pos);
        if(lineEnd == std::string::npos) {
            throw LeafError(ErrorKind::TRANSPORT, "truncated chunked response");
        }
        // 忽略 chunk 扩展参数
        std::string sizeField = payload.substr(pos, lineEnd - pos);
        sizeField = sizeField.substr(0, sizeField.find(';'));

        size_t chunkSize = 0;
        try {
            chunkSize = std::stoul(trim(sizeField), nullptr, 16);
        } catch(const std::exception&) {
            throw LeafError(ErrorKind::TRANSPORT, "malformed chunk size '" + sizeField + "'");
        }

        pos = lineEnd + 2;
        if(chunkSize == 0) {
            return body;
        }
        // 数据后必须紧跟 CRLF；比较时避免 pos + chunkSize 溢出
        size_t available = payload.size() - pos;
        if(chunkSize > available || available - chunkSize < 2) {
            throw LeafError(ErrorKind::TRANSPORT, "truncated chunked response");
        }
        if(payload.compare(pos + chunkSize, 2, "\r\n") != 0) {
            throw LeafError(ErrorKind::TRANSPORT, "chunk data not terminated by CRLF");
        }
        body.append(payload, pos, chunkSize);
        pos += chunkSize + 2;
    }
}

}  // namespace

Url Url::parse(const std::string& url) {
    const std::string scheme = "http://";
    if(toLower(url.substr(0, scheme.size())) != scheme) {
        throw LeafError(ErrorKind::PRECONDITION, "unsupported URL (only http:// is supported): " + url);
    }

    Url result;
    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    result.target = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if(colon != std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        try {
            unsigned long port = std::stoul(portText);
            if(port == 0 || port > 65535) {
                throw std::out_of_range("port");
            }
            result.port = static_cast<uint16_t>(port);
        } catch(const std::exception&) {
            throw LeafError(ErrorKind::PRECONDITION, "invalid port in URL: " + url);
        }
    }

    if(authority.empty()) {
        throw LeafError(ErrorKind::PRECONDITION, "missing host in URL: " + url);
    }
    result.host = authority;
    return result;
}

HttpResponse parseHttpResponse(const std::string& raw) {
    auto headerEnd = raw.find("\r\n\r\n");
    if(headerEnd == std::string::npos) {
        throw LeafError(ErrorKind::TRANSPORT, "incomplete HTTP response header");
    }

    std::istringstream head(raw.substr(0, headerEnd));
    std::string statusLine;
    std::getline(head, statusLine);
    statusLine = trim(statusLine);

    // HTTP/1.1 200 OK
    HttpResponse response;
    std::istringstream statusStream(statusLine);
    std::string version;
    statusStream >> version >> response.statusCode;
    if(version.rfind("HTTP/", 0) != 0 || response.statusCode < 100 || response.statusCode > 599) {
        throw LeafError(ErrorKind::TRANSPORT, "malformed HTTP status line: '" + statusLine + "'");
    }
    std::getline(statusStream, response.status);
    response.status = trim(response.status);

    std::string line;
    while(std::getline(head, line)) {
        auto colon = line.find(':');
        if(colon == std::string::npos) {
            continue;
        }
        response.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    std::string payload = raw.substr(headerEnd + 4);
    auto encoding = response.headers.find("transfer-encoding");
    auto length = response.headers.find("content-length");
    if(encoding != response.headers.end() && toLower(encoding->second).find("chunked") != std::string::npos) {
        response.body = decodeChunked(payload);
    } else if(length != response.headers.end()) {
        size_t expected = 0;
        try {
            expected = std::stoul(length->second);
        } catch(const std::exception&) {
            throw LeafError(ErrorKind::TRANSPORT, "malformed Content-Length '" + length->second + "'");
        }
        if(payload.size() < expected) {
            throw LeafError(ErrorKind::TRANSPORT, "truncated HTTP response body");
        }
        response.body = payload.substr(0, expected);
    } else {
        response.body = payload;
    }
    return response;
}
