#include <database/transaction.hpp>
#include <utils/logger.hpp>
#include <exception>

namespace Roster {

Transaction::Transaction(IDatabaseConnection& conn) : conn_(conn) {
    conn_.begin();
}

Transaction::~Transaction() {
    if (!committed_ && !rolled_back_) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback on scope exit failed: ") + e.what());
        }
    }
}

void Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void Transaction::rollback() {
    rolled_back_ = true;
    conn_.rollback();
}

} // namespace Roster
