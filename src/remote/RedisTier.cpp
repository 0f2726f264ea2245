#include "tiercache/remote/RedisTier.hpp"
#include "tiercache/util/Logging.hpp"
#include <sstream>

namespace tiercache {
namespace remote {

namespace {

std::string replyText(const redisReply* reply) {
    return std::string(reply->str, reply->len);
}

uint64_t infoField(const std::string& text, const std::string& field) {
    std::istringstream in(text);
    std::string line;
    const std::string prefix = field + ":";
    while (std::getline(in, line)) {
        if (line.compare(0, prefix.size(), prefix) == 0) {
            try {
                return std::stoull(line.substr(prefix.size()));
            } catch (const std::exception&) {
                return 0;
            }
        }
    }
    return 0;
}

} // namespace

RedisTier::RedisTier(std::string name, const RemoteTierConfig& config)
    : name_(std::move(name)), config_(config),
      pool_(std::make_unique<RedisConnectionPool>(config)) {}

RedisTier::~RedisTier() {
    disconnect();
}

bool RedisTier::connect() {
    auto logger = util::getLogger();
    pool_->open();

    std::string error;
    auto reply = execute({"PING"}, error);
    if (!reply) {
        logger->error("RedisTier[{}]: не удалось подключиться к {}:{}/{}: {}",
                      name_, config_.host, config_.port, config_.database, error);
        pool_->close();
        connected_.store(false, std::memory_order_release);
        return false;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        logger->error("RedisTier[{}]: PING вернул ошибку: {}", name_, replyText(reply.get()));
        pool_->close();
        connected_.store(false, std::memory_order_release);
        return false;
    }

    connected_.store(true, std::memory_order_release);
    logger->info("RedisTier[{}]: подключён к {}:{}/{} (maxConnections={})",
                 name_, config_.host, config_.port, config_.database, config_.maxConnections);
    return true;
}

void RedisTier::disconnect() {
    if (connected_.exchange(false, std::memory_order_acq_rel)) {
        util::getLogger()->info("RedisTier[{}]: соединения закрыты", name_);
    }
    pool_->close();
}

RedisReplyPtr RedisTier::execute(const std::vector<std::string>& args, std::string& error) {
    auto lease = pool_->acquire(error);
    if (!lease) {
        return nullptr;
    }
    auto reply = RedisConnectionPool::command(lease.get(), args);
    if (!reply) {
        error = args.front() + ": " + lease.get()->errstr;
        lease.invalidate();
    }
    return reply;
}

RemoteResult<std::vector<uint8_t>> RedisTier::get(const std::string& key) {
    using Result = RemoteResult<std::vector<uint8_t>>;
    std::string error;
    auto reply = execute({"GET", key}, error);
    if (!reply) return Result::failure(error);

    switch (reply->type) {
    case REDIS_REPLY_NIL:
        return Result::notFound();
    case REDIS_REPLY_STRING:
        return Result::success(std::vector<uint8_t>(reply->str, reply->str + reply->len));
    case REDIS_REPLY_ERROR:
        return Result::failure("GET: " + replyText(reply.get()));
    default:
        return Result::failure("GET: неожиданный тип ответа " + std::to_string(reply->type));
    }
}

RemoteResult<bool> RedisTier::setEx(const std::string& key, std::chrono::seconds ttl,
                                    const std::vector<uint8_t>& payload) {
    using Result = RemoteResult<bool>;
    std::string error;
    auto reply = execute({"SETEX", key, std::to_string(ttl.count()),
                          std::string(payload.begin(), payload.end())}, error);
    if (!reply) return Result::failure(error);
    if (reply->type == REDIS_REPLY_ERROR) {
        return Result::failure("SETEX: " + replyText(reply.get()));
    }
    return Result::success(true);
}

RemoteResult<size_t> RedisTier::del(const std::vector<std::string>& keys) {
    using Result = RemoteResult<size_t>;
    if (keys.empty()) return Result::success(0);

    std::vector<std::string> args;
    args.reserve(keys.size() + 1);
    args.emplace_back("DEL");
    args.insert(args.end(), keys.begin(), keys.end());

    std::string error;
    auto reply = execute(args, error);
    if (!reply) return Result::failure(error);
    if (reply->type != REDIS_REPLY_INTEGER) {
        return Result::failure(reply->type == REDIS_REPLY_ERROR
                                   ? "DEL: " + replyText(reply.get())
                                   : std::string("DEL: неожиданный тип ответа"));
    }
    return Result::success(static_cast<size_t>(reply->integer));
}

RemoteResult<ScanPage> RedisTier::scan(uint64_t cursor, const std::string& pattern, size_t count) {
    using Result = RemoteResult<ScanPage>;
    std::string error;
    auto reply = execute({"SCAN", std::to_string(cursor), "MATCH", pattern,
                          "COUNT", std::to_string(count)}, error);
    if (!reply) return Result::failure(error);
    if (reply->type == REDIS_REPLY_ERROR) {
        return Result::failure("SCAN: " + replyText(reply.get()));
    }
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2 ||
        reply->element[0]->type != REDIS_REPLY_STRING ||
        reply->element[1]->type != REDIS_REPLY_ARRAY) {
        return Result::failure("SCAN: некорректный формат ответа");
    }

    ScanPage page;
    try {
        page.cursor = std::stoull(replyText(reply->element[0]));
    } catch (const std::exception& e) {
        return Result::failure(std::string("SCAN: некорректный курсор: ") + e.what());
    }
    const redisReply* keys = reply->element[1];
    page.keys.reserve(keys->elements);
    for (size_t i = 0; i < keys->elements; ++i) {
        if (keys->element[i]->type == REDIS_REPLY_STRING) {
            page.keys.push_back(replyText(keys->element[i]));
        }
    }
    return Result::success(std::move(page));
}

RemoteResult<RemoteTierInfo> RedisTier::info() {
    using Result = RemoteResult<RemoteTierInfo>;
    std::string error;
    auto reply = execute({"INFO"}, error);
    if (!reply) return Result::failure(error);
    if (reply->type != REDIS_REPLY_STRING) {
        return Result::failure(reply->type == REDIS_REPLY_ERROR
                                   ? "INFO: " + replyText(reply.get())
                                   : std::string("INFO: неожиданный тип ответа"));
    }

    auto text = replyText(reply.get());
    RemoteTierInfo info;
    info.usedMemory = infoField(text, "used_memory");
    info.usedMemoryPeak = infoField(text, "used_memory_peak");
    info.connectedClients = infoField(text, "connected_clients");
    info.opsPerSec = infoField(text, "instantaneous_ops_per_sec");
    return Result::success(info);
}

} // namespace remote
} // namespace tiercache
