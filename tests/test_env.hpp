#pragma once
#include <string>

// Set or clear an environment variable for the rest of the test process.
// An empty value clears it.
void set_env(const char* name, const char* value);

// Restores the previous value of one variable when the scope ends.
struct scoped_env {
    std::string name;
    std::string saved;
    bool had{false};
    scoped_env(const char* n, const char* value);
    ~scoped_env();
};
