#include "core/cache/backend/RespClient.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLog.hpp"
#include <algorithm>
#include <charconv>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace clinic {
namespace core {
namespace cache {

namespace resp {

namespace {

constexpr int MAX_DEPTH = 8;
constexpr int64_t MAX_BULK_LENGTH = 512LL * 1024 * 1024; // proto-max-bulk-len Redis
constexpr int64_t MAX_ARRAY_COUNT = 1024 * 1024;
constexpr const char* CRLF = "\r\n";

int64_t parseNumber(const std::string& buffer, size_t begin, size_t end) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(buffer.data() + begin, buffer.data() + end, value);
    if (ec != std::errc{} || ptr != buffer.data() + end) {
        throw BackendUnavailable("RESP: некорректное число '" + buffer.substr(begin, end - begin) + "'");
    }
    return value;
}

// Разбор с позиции pos; pos сдвигается только при успехе
std::optional<RespReply> parseAt(const std::string& buffer, size_t& pos, int depth) {
    if (depth > MAX_DEPTH) {
        throw BackendUnavailable("RESP: превышена глубина вложенности");
    }
    if (pos >= buffer.size()) return std::nullopt;
    auto crlf = buffer.find(CRLF, pos);
    if (crlf == std::string::npos) return std::nullopt;

    char marker = buffer[pos];
    size_t lineBegin = pos + 1;
    RespReply reply;
    switch (marker) {
    case '+':
        reply.type = RespReply::Type::SimpleString;
        reply.text = buffer.substr(lineBegin, crlf - lineBegin);
        pos = crlf + 2;
        return reply;
    case '-':
        reply.type = RespReply::Type::Error;
        reply.text = buffer.substr(lineBegin, crlf - lineBegin);
        pos = crlf + 2;
        return reply;
    case ':':
        reply.type = RespReply::Type::Integer;
        reply.integer = parseNumber(buffer, lineBegin, crlf);
        pos = crlf + 2;
        return reply;
    case '$': {
        auto len = parseNumber(buffer, lineBegin, crlf);
        if (len < 0) {
            reply.type = RespReply::Type::Null;
            pos = crlf + 2;
            return reply;
        }
        if (len > MAX_BULK_LENGTH) {
            throw BackendUnavailable("RESP: длина bulk string " + std::to_string(len) + " превышает предел");
        }
        size_t bodyBegin = crlf + 2;
        size_t bodyEnd = bodyBegin + static_cast<size_t>(len);
        if (buffer.size() < bodyEnd + 2) return std::nullopt;
        if (buffer.compare(bodyEnd, 2, CRLF) != 0) {
            throw BackendUnavailable("RESP: bulk string без завершающего CRLF");
        }
        reply.type = RespReply::Type::BulkString;
        reply.text = buffer.substr(bodyBegin, static_cast<size_t>(len));
        pos = bodyEnd + 2;
        return reply;
    }
    case '*': {
        auto count = parseNumber(buffer, lineBegin, crlf);
        if (count < 0) {
            reply.type = RespReply::Type::Null;
            pos = crlf + 2;
            return reply;
        }
        if (count > MAX_ARRAY_COUNT) {
            throw BackendUnavailable("RESP: размер массива " + std::to_string(count) + " превышает предел");
        }
        size_t cursor = crlf + 2;
        reply.type = RespReply::Type::Array;
        reply.elements.reserve(static_cast<size_t>(std::min<int64_t>(count, 64)));
        for (int64_t i = 0; i < count; ++i) {
            auto element = parseAt(buffer, cursor, depth + 1);
            if (!element) return std::nullopt;
            reply.elements.push_back(std::move(*element));
        }
        pos = cursor;
        return reply;
    }
    default:
        throw BackendUnavailable(std::string("RESP: неизвестный тип ответа '") + marker + "'");
    }
}

} // namespace

std::string encodeCommand(const std::vector<std::string>& args) {
    std::string payload;
    payload += '*';
    payload += std::to_string(args.size());
    payload += CRLF;
    for (const auto& arg : args) {
        payload += '$';
        payload += std::to_string(arg.size());
        payload += CRLF;
        payload += arg;
        payload += CRLF;
    }
    return payload;
}

std::optional<RespReply> parseReply(const std::string& buffer, size_t& consumed) {
    size_t pos = 0;
    auto reply = parseAt(buffer, pos, 0);
    if (reply) {
        consumed = pos;
    }
    return reply;
}

} // namespace resp

std::optional<RedisEndpoint> parseRedisUrl(const std::string& url) {
    const std::string scheme = "redis://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }
    RedisEndpoint endpoint;
    std::string rest = url.substr(scheme.size());

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        std::string db = rest.substr(slash + 1);
        if (!db.empty()) {
            int value = 0;
            auto [ptr, ec] = std::from_chars(db.data(), db.data() + db.size(), value);
            if (ec != std::errc{} || ptr != db.data() + db.size() || value < 0) {
                return std::nullopt;
            }
            endpoint.database = value;
        }
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string credentials = authority.substr(0, at);
        auto colon = credentials.find(':');
        endpoint.password = colon == std::string::npos ? credentials : credentials.substr(colon + 1);
        authority = authority.substr(at + 1);
    }

    std::string portText;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        endpoint.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            portText = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            endpoint.host = authority.substr(0, colon);
            portText = authority.substr(colon + 1);
        } else if (!authority.empty()) {
            endpoint.host = authority;
        }
    }
    if (endpoint.host.empty()) {
        return std::nullopt;
    }
    if (!portText.empty()) {
        int port = 0;
        auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc{} || ptr != portText.data() + portText.size() || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        endpoint.port = static_cast<uint16_t>(port);
    }
    return endpoint;
}

RespClient::RespClient(RedisEndpoint endpoint, std::chrono::milliseconds connectTimeout,
                       std::chrono::milliseconds ioTimeout)
    : endpoint_(std::move(endpoint)), connectTimeout_(connectTimeout), ioTimeout_(ioTimeout) {}

RespClient::~RespClient() {
    close();
}

void RespClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buffer_.clear();
}

void RespClient::connect() {
    close();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    auto service = std::to_string(endpoint_.port);
    int rc = ::getaddrinfo(endpoint_.host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw BackendUnavailable("Redis: не удалось разрешить " + endpoint_.host + ": " + gai_strerror(rc));
    }

    std::string lastError = "нет адресов";
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        // Неблокирующий connect с ограниченным ожиданием
        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        int cr = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (cr < 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, static_cast<int>(connectTimeout_.count()));
            if (pr <= 0) {
                lastError = pr == 0 ? "таймаут подключения" : std::strerror(errno);
                ::close(fd);
                continue;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
            if (soError != 0) {
                lastError = std::strerror(soError);
                ::close(fd);
                continue;
            }
        } else if (cr < 0) {
            lastError = std::strerror(errno);
            ::close(fd);
            continue;
        }
        ::fcntl(fd, F_SETFL, flags);

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(ioTimeout_.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((ioTimeout_.count() % 1000) * 1000);
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        fd_ = fd;
        break;
    }
    ::freeaddrinfo(result);

    if (fd_ < 0) {
        throw BackendUnavailable("Redis: не удалось подключиться к " + endpoint_.host + ":" +
                                 std::to_string(endpoint_.port) + ": " + lastError);
    }

    if (!endpoint_.password.empty()) {
        auto reply = command({"AUTH", endpoint_.password});
        if (reply.isError()) {
            close();
            throw BackendUnavailable("Redis: AUTH отклонен: " + reply.text);
        }
    }
    if (endpoint_.database != 0) {
        auto reply = command({"SELECT", std::to_string(endpoint_.database)});
        if (reply.isError()) {
            close();
            throw BackendUnavailable("Redis: SELECT " + std::to_string(endpoint_.database) + " отклонен: " + reply.text);
        }
    }
    cacheLogger()->debug("RespClient: подключен к {}:{} (db={})", endpoint_.host, endpoint_.port, endpoint_.database);
}

RespReply RespClient::command(const std::vector<std::string>& args) {
    if (fd_ < 0) {
        throw BackendUnavailable("Redis: нет соединения");
    }
    try {
        sendAll(resp::encodeCommand(args));
        return readReply();
    } catch (const BackendUnavailable&) {
        close();
        throw;
    } catch (const std::exception& e) {
        // Буфер после сбоя разбора не пригоден для следующих команд
        close();
        throw BackendUnavailable(std::string("Redis: ошибка обработки ответа: ") + e.what());
    }
}

void RespClient::sendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw BackendUnavailable("Redis: таймаут записи");
            }
            throw BackendUnavailable(std::string("Redis: ошибка записи: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

RespReply RespClient::readReply() {
    char chunk[4096];
    while (true) {
        size_t consumed = 0;
        if (auto reply = resp::parseReply(buffer_, consumed)) {
            buffer_.erase(0, consumed);
            return *reply;
        }
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) {
            throw BackendUnavailable("Redis: соединение закрыто сервером");
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw BackendUnavailable("Redis: таймаут чтения");
            }
            throw BackendUnavailable(std::string("Redis: ошибка чтения: ") + std::strerror(errno));
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

} // namespace cache
} // namespace core
} // namespace clinic
