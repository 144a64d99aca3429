#include <catch2/catch.hpp>

#include <rex/allocator/resource_allocator.hpp>
#include <rex/bus/message_bus.hpp>
#include <rex/common/clock.hpp>
#include <rex/common/config.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace rex;
using namespace rex::allocator;
using namespace std::chrono_literals;

namespace {
struct AllocatorFixture {
  Config config;
  ManualClock clock;
  bus::MessageBus bus;
  ResourceAllocator allocator{ config, clock, bus };

  AllocatorFixture() { allocator.addCrew("campaign_crew", 3); }

  static Constraints crew(const std::string& name) {
    Constraints c;
    c.crew = name;
    return c;
  }
  static DomainRecord domain(const std::string& name,
                             DomainTier tier,
                             float reputation) {
    DomainRecord r;
    r.name = name;
    r.tier = tier;
    r.reputation = reputation;
    r.status = Active;
    return r;
  }
};
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Agent slots are bounded per crew",
                 "[allocator][slots]") {
  std::vector<Lease> leases;
  for(rex_id m = 1; m <= 3; ++m) {
    auto r = allocator.acquire(AgentSlot, m, crew("campaign_crew"));
    REQUIRE(std::holds_alternative<Lease>(r));
    leases.push_back(std::get<Lease>(r));
  }

  auto denied = allocator.acquire(AgentSlot, 4, crew("campaign_crew"));
  REQUIRE(std::holds_alternative<Denied>(denied));
  REQUIRE(std::get<Denied>(denied).reason == PoolExhausted);

  REQUIRE(allocator.release(leases[0].id) == REX_OK);
  auto granted = allocator.acquire(AgentSlot, 4, crew("campaign_crew"));
  REQUIRE(std::holds_alternative<Lease>(granted));

  auto unknown = allocator.acquire(AgentSlot, 5, crew("no_such_crew"));
  REQUIRE(std::get<Denied>(unknown).reason == UnknownResource);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Release is idempotent",
                 "[allocator][lease]") {
  auto r = allocator.acquire(AgentSlot, 1, crew("campaign_crew"));
  Lease l = std::get<Lease>(r);

  int releasedSignals = 0;
  allocator.getLeaseReleasedSignal().connect(
    [&releasedSignals](const Lease&) { ++releasedSignals; });

  REQUIRE(allocator.release(l.id) == REX_OK);
  REQUIRE(allocator.release(l.id) == REX_LEASE_NOT_FOUND);
  REQUIRE(allocator.release(4242) == REX_LEASE_NOT_FOUND);
  REQUIRE(releasedSignals == 1);

  auto snap = allocator.snapshot();
  REQUIRE(snap.liveLeases == 0);
  REQUIRE(snap.crews.size() == 1);
  REQUIRE(snap.crews[0].held == 0);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Second lease of the same kind is denied as already held",
                 "[allocator][lease]") {
  auto first = allocator.acquire(AgentSlot, 1, crew("campaign_crew"));
  REQUIRE(std::holds_alternative<Lease>(first));

  auto second = allocator.acquire(AgentSlot, 1, crew("campaign_crew"));
  REQUIRE(std::holds_alternative<Denied>(second));
  REQUIRE(std::get<Denied>(second).reason == AlreadyHeld);

  // The denial reserved nothing.
  auto snap = allocator.snapshot();
  REQUIRE(snap.crews[0].held == 1);
  REQUIRE(snap.liveLeases == 1);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Concurrent acquire and release never exceed crew maximum",
                 "[allocator][slots][concurrency]") {
  std::atomic_int held = 0;
  std::atomic_int maxSeen = 0;
  std::atomic_int grants = 0;

  auto worker = [&](rex_id base) {
    for(int round = 0; round < 200; ++round) {
      rex_id mission = base * 1000 + round;
      auto r = allocator.acquire(AgentSlot, mission, crew("campaign_crew"));
      if(auto l = std::get_if<Lease>(&r)) {
        int now = ++held;
        int prev = maxSeen;
        while(now > prev && !maxSeen.compare_exchange_weak(prev, now)) {
        }
        ++grants;
        --held;
        allocator.release(l->id);
      }
    }
  };

  std::vector<std::thread> threads;
  for(rex_id t = 1; t <= 8; ++t)
    threads.emplace_back(worker, t);
  for(auto& t : threads)
    t.join();

  REQUIRE(grants > 0);
  REQUIRE(maxSeen <= 3);
  REQUIRE(allocator.snapshot().crews[0].held == 0);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Domain selection follows tiers and floors",
                 "[allocator][domain]") {
  REQUIRE(allocator.provisionDomain(domain("low.example", Custom, 0.69f)) ==
          REX_OK);
  REQUIRE(allocator.provisionDomain(domain("pre.example", Prewarmed, 0.85f)) ==
          REX_OK);
  REQUIRE(allocator.provisionDomain(domain("pre-low.example", Prewarmed,
                                           0.75f)) == REX_OK);

  // Custom tier has nothing eligible, so the pre-warmed one is picked.
  Constraints c;
  auto r = allocator.acquire(Domain, 1, c);
  REQUIRE(std::holds_alternative<Lease>(r));
  REQUIRE(std::get<Lease>(r).resource == "pre.example");
  REQUIRE(std::get<Lease>(r).expiresAt);

  REQUIRE(allocator.provisionDomain(domain("custom.example", Custom, 0.7f)) ==
          REX_OK);
  auto r2 = allocator.acquire(Domain, 2, c);
  REQUIRE(std::get<Lease>(r2).resource == "custom.example");

  // Provisioning twice is refused.
  REQUIRE(allocator.provisionDomain(domain("custom.example", Custom, 0.9f)) ==
          REX_INVALID_ARGUMENT);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Dedicated domains are preferred and reserved for their "
                 "campaign",
                 "[allocator][domain]") {
  auto dedicated = domain("acme.example", Custom, 0.9f);
  dedicated.campaignId = "acme";
  REQUIRE(allocator.provisionDomain(dedicated) == REX_OK);
  REQUIRE(allocator.provisionDomain(domain("pool.example", Custom, 0.9f)) ==
          REX_OK);

  Constraints other;
  other.campaignId = "globex";
  for(rex_id m = 1; m <= 4; ++m) {
    auto r = allocator.acquire(Domain, m, other);
    REQUIRE(std::get<Lease>(r).resource == "pool.example");
  }

  Constraints own;
  own.campaignId = "acme";
  own.dedicatedDomain = "acme.example";
  auto r = allocator.acquire(Domain, 10, own);
  REQUIRE(std::get<Lease>(r).resource == "acme.example");
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Domains round-robin inside a tier",
                 "[allocator][domain]") {
  REQUIRE(allocator.provisionDomain(domain("a.example", Custom, 0.9f)) ==
          REX_OK);
  REQUIRE(allocator.provisionDomain(domain("b.example", Custom, 0.9f)) ==
          REX_OK);

  Constraints c;
  auto r1 = std::get<Lease>(allocator.acquire(Domain, 1, c));
  auto r2 = std::get<Lease>(allocator.acquire(Domain, 2, c));
  auto r3 = std::get<Lease>(allocator.acquire(Domain, 3, c));
  REQUIRE(r1.resource != r2.resource);
  REQUIRE(r1.resource == r3.resource);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Reputation drop excludes a domain for later acquires only",
                 "[allocator][domain]") {
  REQUIRE(allocator.provisionDomain(domain("d.example", Custom, 0.75f)) ==
          REX_OK);

  Constraints c;
  auto lease = std::get<Lease>(allocator.acquire(Domain, 1, c));
  REQUIRE(lease.resource == "d.example");

  REQUIRE(allocator.reportReputation("d.example", 0.65f) == REX_OK);
  REQUIRE(allocator.domain("d.example")->status == CoolingDown);

  // Existing lease is honored.
  REQUIRE(allocator.leasesOf(1).size() == 1);

  auto denied = allocator.acquire(Domain, 2, c);
  REQUIRE(std::get<Denied>(denied).reason == NoEligibleDomain);

  REQUIRE(allocator.release(lease.id) == REX_OK);
  REQUIRE(allocator.reportReputation("d.example", 0.8f) == REX_OK);
  REQUIRE(allocator.domain("d.example")->status == Active);
  REQUIRE(std::holds_alternative<Lease>(allocator.acquire(Domain, 2, c)));

  REQUIRE(allocator.reportReputation("d.example", 1.5f) ==
          REX_INVALID_ARGUMENT);
  REQUIRE(allocator.reportReputation("nope.example", 0.5f) ==
          REX_DOMAIN_NOT_FOUND);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Domains retire after consecutive readings below floor",
                 "[allocator][domain]") {
  REQUIRE(allocator.provisionDomain(domain("r.example", Custom, 0.9f)) ==
          REX_OK);

  for(int i = 0; i < 4; ++i)
    REQUIRE(allocator.reportReputation("r.example", 0.5f) == REX_OK);
  REQUIRE(allocator.domain("r.example")->status == CoolingDown);
  REQUIRE(allocator.domain("r.example")->subFloorReadings == 4);

  // A good reading resets the counter.
  REQUIRE(allocator.reportReputation("r.example", 0.9f) == REX_OK);
  REQUIRE(allocator.domain("r.example")->subFloorReadings == 0);

  for(int i = 0; i < 5; ++i)
    REQUIRE(allocator.reportReputation("r.example", 0.5f) == REX_OK);
  REQUIRE(allocator.domain("r.example")->status == Retired);

  // Retirement is permanent.
  REQUIRE(allocator.reportReputation("r.example", 1.0f) == REX_OK);
  REQUIRE(allocator.domain("r.example")->status == Retired);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Delivery outcomes move reputation",
                 "[allocator][domain]") {
  REQUIRE(allocator.provisionDomain(domain("o.example", Custom, 0.75f)) ==
          REX_OK);

  REQUIRE(allocator.recordDeliveryOutcome("o.example", Bounced) == REX_OK);
  float afterBounce = allocator.domain("o.example")->reputation;
  REQUIRE(afterBounce < 0.75f);

  REQUIRE(allocator.recordDeliveryOutcome("o.example", Delivered) == REX_OK);
  REQUIRE(allocator.domain("o.example")->reputation > afterBounce);

  REQUIRE(allocator.recordDeliveryOutcome("o.example", Complained) == REX_OK);
  REQUIRE(allocator.domain("o.example")->reputation < 0.7f);
  REQUIRE(allocator.domain("o.example")->status == CoolingDown);

  REQUIRE(allocator.recordDeliveryOutcome("x.example", Delivered) ==
          REX_DOMAIN_NOT_FOUND);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Warming domains activate after warmup",
                 "[allocator][domain]") {
  auto warming = domain("w.example", Prewarmed, 0.85f);
  warming.status = Warming;
  REQUIRE(allocator.provisionDomain(warming) == REX_OK);

  Constraints c;
  REQUIRE(std::holds_alternative<Denied>(allocator.acquire(Domain, 1, c)));

  for(int day = 0; day < 13; ++day)
    REQUIRE(allocator.advanceWarmupDay() == 0);
  REQUIRE(allocator.advanceWarmupDay() == 1);
  REQUIRE(allocator.domain("w.example")->status == Active);
  REQUIRE(std::holds_alternative<Lease>(allocator.acquire(Domain, 1, c)));
}

TEST_CASE_METHOD(AllocatorFixture,
                 "API quotas deny when empty and refill on schedule",
                 "[allocator][quota]") {
  Constraints c;
  c.quota[Email] = 60;

  auto first = allocator.acquire(ApiQuota, 1, c);
  REQUIRE(std::holds_alternative<Lease>(first));

  auto second = allocator.acquire(ApiQuota, 2, c);
  REQUIRE(std::holds_alternative<Denied>(second));
  REQUIRE(std::get<Denied>(second).reason == QuotaExhausted);

  // Denial consumed nothing.
  auto snap = allocator.snapshot();
  REQUIRE(snap.quotas[Email].remaining == 40);
  REQUIRE(snap.quotas[LLM].remaining == 10000);

  clock.advance(61s);
  REQUIRE(std::holds_alternative<Lease>(allocator.acquire(ApiQuota, 2, c)));

  Constraints empty;
  REQUIRE(std::get<Denied>(allocator.acquire(ApiQuota, 3, empty)).reason ==
          InvalidConstraints);
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Expired leases are reaped",
                 "[allocator][lease]") {
  REQUIRE(allocator.provisionDomain(domain("e.example", Custom, 0.9f)) ==
          REX_OK);

  Constraints c;
  c.crew = "campaign_crew";
  c.quota[LLM] = 5;
  REQUIRE(std::holds_alternative<Lease>(allocator.acquire(Domain, 1, c)));
  REQUIRE(std::holds_alternative<Lease>(allocator.acquire(ApiQuota, 1, c)));
  REQUIRE(std::holds_alternative<Lease>(allocator.acquire(AgentSlot, 1, c)));

  REQUIRE(allocator.reapExpired() == 0);
  clock.advance(61s);
  REQUIRE(allocator.reapExpired() == 1);
  clock.advance(5h);
  REQUIRE(allocator.reapExpired() == 1);

  // Agent slots never expire on their own.
  REQUIRE(allocator.leasesOf(1).size() == 1);
  REQUIRE(allocator.releaseAll(1) == 1);
  REQUIRE(allocator.leasesOf(1).empty());
}

TEST_CASE_METHOD(AllocatorFixture,
                 "Pool exhaustion is published once per exhaustion",
                 "[allocator][events]") {
  int exhausted = 0;
  bus.subscribe(bus::ResourcePoolExhausted,
                [&exhausted](const bus::Event&) { ++exhausted; });

  allocator.addCrew("tiny_crew", 1);
  auto l = std::get<Lease>(allocator.acquire(AgentSlot, 1, crew("tiny_crew")));
  allocator.acquire(AgentSlot, 2, crew("tiny_crew"));
  allocator.acquire(AgentSlot, 3, crew("tiny_crew"));
  REQUIRE(exhausted == 1);

  allocator.release(l.id);
  allocator.acquire(AgentSlot, 2, crew("tiny_crew"));
  allocator.acquire(AgentSlot, 3, crew("tiny_crew"));
  REQUIRE(exhausted == 2);
}

TEST_CASE("Parse domain records", "[allocator][domain]") {
  DomainRecord r;
  REQUIRE(ParseDomainRecord("mail.example:custom:0.75", r));
  REQUIRE(r.name == "mail.example");
  REQUIRE(r.tier == Custom);
  REQUIRE(r.reputation == Approx(0.75));
  REQUIRE(r.status == Active);
  REQUIRE(!r.campaignId);

  REQUIRE(ParseDomainRecord("x.example:prewarmed:0.9:warming:acme", r));
  REQUIRE(r.tier == Prewarmed);
  REQUIRE(r.status == Warming);
  REQUIRE(r.campaignId == std::string("acme"));

  REQUIRE_FALSE(ParseDomainRecord("x.example:gold:0.9", r));
  REQUIRE_FALSE(ParseDomainRecord("x.example:custom:1.9", r));
  REQUIRE_FALSE(ParseDomainRecord("x.example:custom:abc", r));
  REQUIRE_FALSE(ParseDomainRecord("x.example", r));
}
