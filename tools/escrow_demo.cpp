/**
 * Escrow Demo
 *
 * Walks one seller (Joe) and one buyer (John) through every way an escrow
 * can end:
 * - seller confirms payment
 * - buyer cancels
 * - dispute, resolved by the arbitrator for each side
 *
 * Usage:
 *   ./escrow_demo [-c config.json] [-a base_units] [-v]
 */

#include "../include/auth/authority.hpp"
#include "../include/config/engine_config.hpp"
#include "../include/ledger/in_memory_ledger.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/escrow_engine.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/string_utils.hpp"
#include "../include/util/time_utils.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace p2p;
using namespace p2p::market;

namespace {

constexpr Principal JOE = 1;
constexpr Principal JOHN = 2;
constexpr Principal DEFAULT_ARBITRATOR = 900;

bool check(Status s, const char* what) {
    std::cout << "  " << std::left << std::setw(34) << what << status_to_string(s) << "\n";
    return s == Status::Ok;
}

void print_state(const EscrowEngine& engine, const ledger::InMemoryLedger& ledger) {
    std::cout << "\n[ Balances ]\n";
    for (Principal who : {JOE, JOHN}) {
        auto p = engine.profile(who);
        std::cout << "  " << std::setw(6) << (p ? p->name : "?") << " deposited="
                  << util::format_tokens(engine.deposited_balance(who))
                  << " available=" << util::format_tokens(engine.available_balance(who))
                  << " wallet=" << util::format_tokens(ledger.balance_of(who)) << "\n";
    }
    std::cout << "  custody=" << util::format_tokens(ledger.custody_balance())
              << " (books: " << util::format_tokens(engine.total_custody()) << ")\n";

    std::cout << "[ Reputation ]\n";
    for (Principal who : {JOE, JOHN}) {
        auto p = engine.profile(who);
        if (!p) continue;
        std::cout << "  " << std::setw(6) << p->name << " trades=" << p->total_trades
                  << " completed=" << p->completed_trades << " disputed=" << p->disputed_trades
                  << " avg_settle=" << p->avg_settlement_secs << "s\n";
    }
    std::cout << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args)) {
        return 1;
    }
    if (args.help) {
        util::print_help();
        return 0;
    }

    config::EngineConfig cfg;
    try {
        if (!args.config_path.empty()) {
            cfg = config::ConfigLoader::load(args.config_path);
        }
        if (!args.save_config.empty()) {
            config::ConfigLoader::save(args.save_config, cfg);
            std::cout << "Config written to " << args.save_config << "\n";
            return 0;
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }
    if (cfg.arbitrator == NO_PRINCIPAL) {
        cfg.arbitrator = DEFAULT_ARBITRATOR;
    }

    logging::AsyncLogger logger;
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : static_cast<logging::LogLevel>(cfg.log_level));
    logger.start();

    ledger::InMemoryLedger ledger;
    auth::SingleArbitrator arbitrator(cfg.arbitrator);
    EscrowEngine engine(ledger, arbitrator, cfg);
    engine.set_logger(&logger);

    Timestamp now = util::wall_clock_secs();

    std::cout << "=== Setup ===\n";
    ledger.mint(JOE, tokens(5000));
    ledger.approve(JOE, tokens(2000));

    bool ok = check(engine.create_profile(JOE, "Joe", "joe@example.com", "+2348000000001", now), "create_profile(Joe)");
    ok = ok && check(engine.create_profile(JOHN, "John", "john@example.com", "+2348000000002", now),
                     "create_profile(John)");
    ok = ok && check(engine.deposit(JOE, tokens(2000), now), "deposit(Joe, 2000)");

    OfferParams params;
    params.min_trade = tokens(10);
    params.max_trade = tokens(1000);
    params.price = 8000;
    params.currency = "NGN";
    params.payment_method = "Bank Transfer";

    OfferId offer = INVALID_OFFER_ID;
    ok = ok && check(engine.create_offer(JOE, params, now, offer), "create_offer(10..1000 @ 8000 NGN)");
    if (!ok) {
        logger.stop();
        return 1;
    }
    print_state(engine, ledger);

    std::cout << "=== Confirmed trade ===\n";
    Amount trade = args.trade_amount != 0 ? args.trade_amount : tokens(1000);
    std::string label = "open_escrow(John, " + util::format_tokens(trade) + ")";
    EscrowId e1 = INVALID_ESCROW_ID;
    check(engine.open_escrow(JOHN, offer, trade, now, e1), label.c_str());
    if (auto e = engine.escrow(e1)) {
        std::cout << "  fiat amount: " << util::to_string(e->fiat_amount) << " " << params.currency << "\n";
    }
    check(engine.confirm_payment(e1, JOE, now + util::hours(2)), "confirm_payment(Joe)");
    print_state(engine, ledger);

    std::cout << "=== Cancelled trade ===\n";
    EscrowId e2 = INVALID_ESCROW_ID;
    check(engine.open_escrow(JOHN, offer, tokens(250), now, e2), "open_escrow(John, 250)");
    check(engine.cancel_escrow(e2, JOHN, now + util::hours(1)), "cancel_escrow(John)");
    print_state(engine, ledger);

    std::cout << "=== Disputed trades ===\n";
    EscrowId e3 = INVALID_ESCROW_ID;
    check(engine.open_escrow(JOHN, offer, tokens(100), now, e3), "open_escrow(John, 100)");
    check(engine.raise_dispute(e3, JOHN, now + util::hours(3)), "raise_dispute(John)");
    check(engine.resolve_dispute(e3, true, JOHN, now + util::hours(4)), "resolve_dispute(John) [not arbitrator]");
    check(engine.resolve_dispute(e3, true, cfg.arbitrator, now + util::hours(4)), "resolve_dispute(buyer wins)");

    EscrowId e4 = INVALID_ESCROW_ID;
    check(engine.open_escrow(JOHN, offer, tokens(50), now, e4), "open_escrow(John, 50)");
    check(engine.raise_dispute(e4, JOE, now + util::hours(3)), "raise_dispute(Joe)");
    check(engine.resolve_dispute(e4, false, cfg.arbitrator, now + util::hours(5)), "resolve_dispute(seller wins)");
    print_state(engine, ledger);

    std::cout << "=== Wind down ===\n";
    check(engine.deactivate_offer(offer, JOE, now + util::hours(6)), "deactivate_offer(Joe)");
    check(engine.withdraw(JOE, engine.available_balance(JOE), now + util::hours(6)), "withdraw(Joe, all)");
    print_state(engine, ledger);

    std::cout << "Invariants: " << (engine.check_invariants() ? "OK" : "VIOLATED") << "\n";

    logger.stop();
    if (logger.dropped_count() > 0) {
        std::cerr << "(" << logger.dropped_count() << " log entries dropped)\n";
    }
    return engine.check_invariants() ? 0 : 1;
}
