#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace coop_ledger {

// Column name to text value. SQL NULL reads as an empty string.
using SqlRow = std::unordered_map<std::string, std::string>;

// One database connection. Statements run in order on the same connection,
// so BEGIN/COMMIT issued through Execute bracket the statements between them.
class ISqlSession {
public:
    virtual ~ISqlSession() = default;

    // `rows` may be null for statements whose result is not needed.
    virtual bool Execute(const std::string& sql,
                         const std::vector<std::string>& params,
                         std::vector<SqlRow>* rows,
                         std::string* error) = 0;
    virtual bool Ping(std::string* error) = 0;
};

}  // namespace coop_ledger
