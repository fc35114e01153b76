#pragma once

#include "venue/lending_pool.hpp"
#include "venue/venue_exception.hpp"
#include <gmock/gmock.h>

namespace arbx {
namespace testing {

class MockLendingPool : public LendingPool {
public:
    MOCK_METHOD(Address, address, (), (const, override));
    MOCK_METHOD(double, flash_loan_premium, (), (const, override));
    MOCK_METHOD(void, flash_loan,
                (const Address&, FlashLoanReceiver&, TokenCustody&, const FlashLoanRequest&, const std::string&),
                (override));
    MOCK_METHOD(void, begin_sequence, (), (override));
    MOCK_METHOD(void, commit_sequence, (), (override));
    MOCK_METHOD(void, revert_sequence, (), (override));

    // Lends, calls back and pulls principal + fee the way a real pool does
    void lend_and_collect(const Address& initiator, FlashLoanReceiver& receiver, TokenCustody& custody,
                          const FlashLoanRequest& request, const std::string& params) {
        const Address self = address();
        std::vector<double> fees;
        for (double amount : request.amounts) {
            fees.push_back(amount * flash_loan_premium());
        }
        for (size_t i = 0; i < request.assets.size(); ++i) {
            custody.transfer_in(self, request.assets[i], request.amounts[i]);
        }
        if (!receiver.on_loan_received(self, request.assets, request.amounts, fees, initiator, params)) {
            throw VenueException("receiver returned false");
        }
        for (size_t i = 0; i < request.assets.size(); ++i) {
            custody.transfer_from(self, request.assets[i], request.amounts[i] + fees[i]);
        }
    }
};

class MockFlashLoanReceiver : public FlashLoanReceiver {
public:
    MOCK_METHOD(bool, on_loan_received,
                (const Address&, const std::vector<Address>&, const std::vector<double>&,
                 const std::vector<double>&, const Address&, const std::string&),
                (override));
};

} // namespace testing
} // namespace arbx
