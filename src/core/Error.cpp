#include "rulecat/core/Error.h"

namespace rulecat {

char UsageError::ID = 0;

} // namespace rulecat
