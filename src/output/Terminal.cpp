#include "rulecat/output/Terminal.h"

#include <llvm/Support/Process.h>

namespace rulecat {

unsigned currentTerminalWidth() {
    return llvm::sys::Process::StandardOutColumns();
}

} // namespace rulecat
