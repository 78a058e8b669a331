#define BOOST_TEST_MODULE benefactor_tests
#include <boost/test/unit_test.hpp>

#include "tests/test_benefactor.hpp"
#include "benefactor/logging.hpp"

namespace benefactor {
namespace test {

Address make_address(uint8_t tag) {
    Address addr;
    if (tag != 0) {
        addr.payment_credential[0] = 0xd0;
        addr.payment_credential[27] = tag;
    }
    return addr;
}

ProofData make_proof(const std::string& text) {
    return ProofData{Bytes(text.begin(), text.end())};
}

DonationSetup::DonationSetup()
    : admin(make_address(0xA0)),
      payout(make_address(0xC0)),
      rail(std::make_shared<payment::AccountRail>()),
      registry(std::make_shared<benefactor::registry::TokenRegistry>(admin, "https://x/")),
      ledger(std::make_shared<benefactor::ledger::DonationLedger>()),
      verifier(std::make_shared<verification::AlwaysAcceptNonEmpty>()),
      db(std::make_shared<FlakyDatabase>()),
      store(std::make_shared<storage::StateStore>(db)) {
    charity.name = "Clean Water";
    charity.foundation = "Water Foundation";
    charity.link = "https://water.example";
    charity.suggested_price = Amount(1000);

    storage::StateStore::Batch meta;
    meta.put_meta(admin, "https://x/");
    store->commit(meta);

    orchestrator = std::make_shared<DonationOrchestrator>(charity, payout, rail, registry, ledger,
                                                          verifier, store);
}

void DonationSetup::fund(const Address& donor, const Amount& amount) {
    rail->credit(donor, amount);
    rail->approve(donor, rail->allowance(donor) + amount);
}

} // namespace test
} // namespace benefactor

struct QuietLogging {
    QuietLogging() { benefactor::logging::set_level(benefactor::logging::Level::Error); }
};

BOOST_GLOBAL_FIXTURE(QuietLogging);
