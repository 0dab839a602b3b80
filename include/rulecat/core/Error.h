#pragma once

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <system_error>

namespace rulecat {

// The invocation itself is wrong (unknown rule, conflicting flags).
class UsageError : public llvm::ErrorInfo<UsageError> {
public:
    static char ID;

    explicit UsageError(std::string message) : message_(std::move(message)) {}

    const std::string &getMessage() const { return message_; }

    void log(llvm::raw_ostream &os) const override { os << message_; }

    std::error_code convertToErrorCode() const override {
        return std::make_error_code(std::errc::invalid_argument);
    }

private:
    std::string message_;
};

} // namespace rulecat
