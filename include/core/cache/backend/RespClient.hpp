#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clinic {
namespace core {
namespace cache {

// RespReply: разобранный ответ Redis (RESP2)
struct RespReply {
    enum class Type { SimpleString, Error, Integer, BulkString, Null, Array };
    Type type = Type::Null;
    std::string text;      // SimpleString, Error, BulkString
    int64_t integer = 0;   // Integer
    std::vector<RespReply> elements; // Array

    bool isError() const { return type == Type::Error; }
    bool isNull() const { return type == Type::Null; }
};

namespace resp {

// Команда как массив bulk-строк: *N\r\n$len\r\narg\r\n...
std::string encodeCommand(const std::vector<std::string>& args);

// Разобрать один ответ с начала буфера.
// nullopt: данных пока недостаточно; consumed получает длину ответа.
// Бросает BackendUnavailable на некорректных данных.
std::optional<RespReply> parseReply(const std::string& buffer, size_t& consumed);

} // namespace resp

// RedisEndpoint: разобранная строка подключения redis://[:password@]host[:port][/db]
struct RedisEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    int database = 0;
    std::string password;
};

std::optional<RedisEndpoint> parseRedisUrl(const std::string& url);

// RespClient: блокирующее TCP-соединение с Redis с ограниченными таймаутами.
// Не потокобезопасен; синхронизацию обеспечивает владелец.
class RespClient {
public:
    RespClient(RedisEndpoint endpoint, std::chrono::milliseconds connectTimeout,
               std::chrono::milliseconds ioTimeout);
    ~RespClient();
    RespClient(const RespClient&) = delete;
    RespClient& operator=(const RespClient&) = delete;

    void connect(); // Бросает BackendUnavailable
    void close();
    bool isConnected() const { return fd_ >= 0; }
    // Ответ-ошибка сервера возвращается как Type::Error; сетевые ошибки бросают BackendUnavailable
    RespReply command(const std::vector<std::string>& args);
    const RedisEndpoint& endpoint() const { return endpoint_; }
private:
    void sendAll(const std::string& data);
    RespReply readReply();

    RedisEndpoint endpoint_;
    std::chrono::milliseconds connectTimeout_;
    std::chrono::milliseconds ioTimeout_;
    int fd_ = -1;
    std::string buffer_;
};

} // namespace cache
} // namespace core
} // namespace clinic
