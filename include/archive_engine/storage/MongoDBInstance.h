#pragma once

#include <memory>
#include <mutex>

namespace mongocxx {
    class instance;
}

namespace archive_engine::storage {

// The driver allows exactly one mongocxx::instance per process
class MongoDBInstance {
private:
    static std::unique_ptr<mongocxx::instance> instance;
    static std::mutex mutex;

public:
    static mongocxx::instance& getInstance();
};

} // namespace archive_engine::storage
