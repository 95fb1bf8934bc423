// =================================================================
// tests/QuotaGateTest.cpp
// =================================================================
// Unit tests for admission control, rate limiting and quota resets.

#include "Modelgate/InMemoryStore.hpp"
#include "Modelgate/Logger.hpp"
#include "Modelgate/QuotaGate.hpp"
#include "Modelgate/RateLimiter.hpp"
#include "MockProviderAdapter.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace Modelgate;

class QuotaGateTest {
private:
    std::unique_ptr<InMemoryStore> m_store;
    std::unique_ptr<QuotaGate> m_gate;
    Endpoint m_endpoint;

    Quota makeQuota(const std::string& id, const std::string& caller, int64_t max_calls, int64_t used_calls) {
        Quota quota;
        quota.id = id;
        quota.endpoint_id = m_endpoint.id;
        quota.caller_id = caller;
        quota.period = QuotaPeriod::DAILY;
        quota.max_calls = max_calls;
        quota.used_calls = used_calls;
        quota.reset_at = Clock::now() + std::chrono::hours(1);
        quota.last_reset = Clock::now();
        return quota;
    }

    void reset() {
        m_store = std::make_unique<InMemoryStore>();
        m_gate = std::make_unique<QuotaGate>(*m_store);
        m_endpoint = makeTestEndpoint("quota-endpoint");
        m_store->putEndpoint(m_endpoint);
    }

public:
    QuotaGateTest() {
        Logger::getInstance().setConsoleLogging(false);
        Logger::getInstance().setFileLogging(false);
    }

    void testExhaustedQuotaDenies() {
        std::cout << "Testing exhausted quota denial..." << std::endl;
        reset();

        m_store->putQuota(makeQuota("q-full", "alice", 5, 5));

        AdmissionDecision decision = m_gate->check(m_endpoint, "alice");
        assert(!decision.allowed);
        assert(decision.denial_status == CallStatus::QUOTA_EXCEEDED);
        assert(decision.quota_id == "q-full");
        assert(decision.reason.find("calls: 5/5") != std::string::npos);

        // Another caller is not affected by alice's quota
        assert(m_gate->check(m_endpoint, "bob").allowed);

        std::cout << "✓ Exhausted quota test passed" << std::endl;
    }

    void testZeroMeansUnlimited() {
        std::cout << "Testing that a zero ceiling is unlimited..." << std::endl;
        reset();

        Quota quota = makeQuota("q-unlimited", "alice", 0, 1000000);
        quota.used_tokens = 1000000;
        quota.used_cost = 1000.0;
        m_store->putQuota(quota);

        for (int i = 0; i < 10; ++i) {
            assert(m_gate->check(m_endpoint, "alice").allowed);
        }

        std::cout << "✓ Unlimited quota test passed" << std::endl;
    }

    void testGlobalQuotaAppliesToEveryCaller() {
        std::cout << "Testing endpoint-wide quota..." << std::endl;
        reset();

        Quota quota = makeQuota("q-global", "", 0, 0);
        quota.max_cost = 1.0;
        quota.used_cost = 1.0;
        m_store->putQuota(quota);

        assert(!m_gate->check(m_endpoint, "alice").allowed);
        assert(!m_gate->check(m_endpoint, "").allowed);

        std::cout << "✓ Global quota test passed" << std::endl;
    }

    void testCommitIncrementsEveryApplicableQuota() {
        std::cout << "Testing usage commit..." << std::endl;
        reset();

        m_store->putQuota(makeQuota("q-alice", "alice", 10, 0));
        m_store->putQuota(makeQuota("q-global", "", 100, 0));
        m_store->putQuota(makeQuota("q-bob", "bob", 10, 0));

        m_gate->commit(m_endpoint, "alice", 150, 0.25);

        auto alice = m_store->getQuota("q-alice");
        auto global = m_store->getQuota("q-global");
        auto bob = m_store->getQuota("q-bob");
        assert(alice->used_calls == 1 && alice->used_tokens == 150);
        assert(std::fabs(alice->used_cost - 0.25) < 1e-9);
        assert(global->used_calls == 1);
        assert(bob->used_calls == 0);

        std::cout << "✓ Commit test passed" << std::endl;
    }

    void testInactiveQuotaIgnored() {
        std::cout << "Testing inactive quota..." << std::endl;
        reset();

        Quota quota = makeQuota("q-inactive", "alice", 1, 1);
        quota.is_active = false;
        m_store->putQuota(quota);

        assert(m_gate->check(m_endpoint, "alice").allowed);

        std::cout << "✓ Inactive quota test passed" << std::endl;
    }

    void testDailyCeilingCountsTodaysSuccesses() {
        std::cout << "Testing endpoint daily call ceiling..." << std::endl;
        reset();

        m_endpoint.daily_quota = 2;
        m_store->putEndpoint(m_endpoint);

        auto now = Clock::now();
        m_store->appendCallRecord(makeRecord(m_endpoint.id, CallStatus::SUCCESS, std::chrono::milliseconds(10), now));
        m_store->appendCallRecord(makeRecord(m_endpoint.id, CallStatus::FAILED, std::chrono::milliseconds(10), now));
        assert(m_gate->check(m_endpoint, "", now).allowed);

        m_store->appendCallRecord(makeRecord(m_endpoint.id, CallStatus::SUCCESS, std::chrono::milliseconds(10), now));
        AdmissionDecision decision = m_gate->check(m_endpoint, "", now);
        assert(!decision.allowed);
        assert(decision.denial_status == CallStatus::QUOTA_EXCEEDED);

        // Yesterday's successes do not count
        auto tomorrow = now + std::chrono::hours(24);
        assert(m_gate->check(m_endpoint, "", tomorrow).allowed);

        std::cout << "✓ Daily ceiling test passed" << std::endl;
    }

    void testRateLimit() {
        std::cout << "Testing per-minute rate limit..." << std::endl;
        reset();

        m_endpoint.rate_limit_rpm = 3;
        m_store->putEndpoint(m_endpoint);

        auto now = Clock::now();
        for (int i = 0; i < 3; ++i) {
            assert(m_gate->check(m_endpoint, "", now).allowed);
        }

        AdmissionDecision decision = m_gate->check(m_endpoint, "", now);
        assert(!decision.allowed);
        assert(decision.denial_status == CallStatus::RATE_LIMITED);

        // The window slides after a minute
        assert(m_gate->check(m_endpoint, "", now + std::chrono::seconds(61)).allowed);

        std::cout << "✓ Rate limit test passed" << std::endl;
    }

    void testTokenRateLimit() {
        std::cout << "Testing per-minute token limit..." << std::endl;

        RateLimiter limiter(0, 1000);
        auto now = Clock::now();

        assert(limiter.tryAcquire(now).allowed);
        limiter.recordTokens(now, 1200);
        assert(limiter.tokensInWindow(now) == 1200);

        RateDecision denied = limiter.tryAcquire(now + std::chrono::seconds(10));
        assert(!denied.allowed);
        assert(denied.reason.find("tokens per minute") != std::string::npos);

        assert(limiter.tryAcquire(now + std::chrono::seconds(61)).allowed);
        assert(limiter.tokensInWindow(now + std::chrono::seconds(61)) == 0);

        std::cout << "✓ Token limit test passed" << std::endl;
    }

    void testResetQuota() {
        std::cout << "Testing quota reset..." << std::endl;
        reset();

        auto now = Clock::now();
        Quota quota = makeQuota("q-daily", "alice", 5, 5);
        quota.used_tokens = 400;
        quota.used_cost = 2.0;
        quota.reset_at = now - std::chrono::hours(50);
        m_store->putQuota(quota);

        assert(m_gate->resetQuota("q-daily", now));

        auto reset_quota = m_store->getQuota("q-daily");
        assert(reset_quota->used_calls == 0);
        assert(reset_quota->used_tokens == 0);
        assert(reset_quota->used_cost == 0.0);
        assert(reset_quota->reset_at > now);
        assert(reset_quota->reset_at - now <= std::chrono::hours(24));
        // Whole periods from the previous reset time
        assert(reset_quota->reset_at == quota.reset_at + std::chrono::hours(72));

        assert(m_gate->check(m_endpoint, "alice", now).allowed);

        assert(!m_gate->resetQuota("missing", now));

        std::cout << "✓ Quota reset test passed" << std::endl;
    }

    void testLifetimeQuotaNeverResets() {
        std::cout << "Testing lifetime quota..." << std::endl;
        reset();

        auto now = Clock::now();
        Quota quota = makeQuota("q-lifetime", "", 3, 3);
        quota.period = QuotaPeriod::LIFETIME;
        quota.reset_at = now - std::chrono::hours(1);
        m_store->putQuota(quota);

        assert(!m_gate->resetQuota("q-lifetime", now));
        assert(m_gate->resetDueQuotas(now) == 0);
        assert(m_store->getQuota("q-lifetime")->used_calls == 3);

        std::cout << "✓ Lifetime quota test passed" << std::endl;
    }

    void testResetDueQuotas() {
        std::cout << "Testing due quota resets..." << std::endl;
        reset();

        auto now = Clock::now();
        Quota due = makeQuota("q-due", "", 10, 7);
        due.reset_at = now - std::chrono::minutes(1);
        Quota not_due = makeQuota("q-not-due", "", 10, 7);
        not_due.reset_at = now + std::chrono::hours(3);
        Quota weekly = makeQuota("q-weekly", "", 10, 7);
        weekly.period = QuotaPeriod::WEEKLY;
        weekly.reset_at = now - std::chrono::hours(1);

        m_store->putQuota(due);
        m_store->putQuota(not_due);
        m_store->putQuota(weekly);

        assert(m_gate->resetDueQuotas(now) == 2);
        assert(m_store->getQuota("q-due")->used_calls == 0);
        assert(m_store->getQuota("q-not-due")->used_calls == 7);
        assert(m_store->getQuota("q-weekly")->used_calls == 0);
        assert(m_store->getQuota("q-weekly")->reset_at == weekly.reset_at + std::chrono::hours(24 * 7));

        std::cout << "✓ Due quota reset test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running QuotaGate unit tests..." << std::endl;
        std::cout << "================================" << std::endl << std::endl;

        testExhaustedQuotaDenies();
        testZeroMeansUnlimited();
        testGlobalQuotaAppliesToEveryCaller();
        testCommitIncrementsEveryApplicableQuota();
        testInactiveQuotaIgnored();
        testDailyCeilingCountsTodaysSuccesses();
        testRateLimit();
        testTokenRateLimit();
        testResetQuota();
        testLifetimeQuotaNeverResets();
        testResetDueQuotas();

        std::cout << std::endl << "All QuotaGate tests passed!" << std::endl;
    }
};

int main() {
    try {
        QuotaGateTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
