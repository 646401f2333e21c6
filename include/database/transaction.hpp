#pragma once

#include <database/idatabase_connection.hpp>

namespace Roster {

/**
 * @brief RAII transaction guard.
 *
 * Issues BEGIN on construction and ROLLBACK on destruction unless
 * commit() or rollback() was called first.
 */
class Transaction {
public:
    explicit Transaction(IDatabaseConnection& conn);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

private:
    IDatabaseConnection& conn_;
    bool committed_ = false;
    bool rolled_back_ = false;
};

} // namespace Roster
