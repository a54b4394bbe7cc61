#pragma once
#include <optional>
#include <string>

// Test-only scoped environment override for the STAGEC_* variables read by detectEnv().
// Restores (or unsets) the previous value on destruction.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};
