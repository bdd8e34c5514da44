#include "../../include/archive_engine/storage/MongoDBInstance.h"
#include "../../include/Logger.h"
#include <mongocxx/instance.hpp>

namespace archive_engine::storage {

std::unique_ptr<mongocxx::instance> MongoDBInstance::instance;
std::mutex MongoDBInstance::mutex;

mongocxx::instance& MongoDBInstance::getInstance() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!instance) {
        LOG_DEBUG("Creating mongocxx driver instance");
        instance = std::make_unique<mongocxx::instance>();
    }
    return *instance;
}

} // namespace archive_engine::storage
