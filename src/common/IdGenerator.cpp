#include "../../include/archive_engine/common/IdGenerator.h"
#include <uuid/uuid.h>

namespace archive_engine::common {

std::string generateId() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

} // namespace archive_engine::common
