/*
 * Copyright 2025 Accord Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <catch2/catch_test_macros.hpp>

#include "federation/instance_registry.hpp"
#include "federation/trust_store.hpp"

using namespace accord::federation;

namespace {

BilateralTrust edge(std::string source, std::string target,
                    std::vector<std::string> scopes = {"policy:base"}) {
    BilateralTrust trust;
    trust.source_instance = std::move(source);
    trust.target_instance = std::move(target);
    trust.max_classification = "SECRET";
    trust.allowed_scopes = std::move(scopes);
    return trust;
}

Clock::time_point fixed_now() {
    return from_unix_seconds(1'760'000'000);
}

}  // namespace

TEST_CASE("TrustMatrix - Edges are directional", "[trust_matrix]") {
    auto store = std::make_shared<StaticTrustStore>(TrustEdges{edge("USA", "FRA")});
    TrustMatrix matrix(store);

    REQUIRE(matrix.has_trust("USA", "FRA"));
    REQUIRE_FALSE(matrix.has_trust("FRA", "USA"));
    REQUIRE_FALSE(matrix.has_trust("USA", "GBR"));

    auto trust = matrix.verify_trust("USA", "FRA");
    REQUIRE(trust.has_value());
    REQUIRE(trust->max_classification == "SECRET");
}

TEST_CASE("TrustMatrix - Instance ids compare case-insensitively", "[trust_matrix]") {
    auto store = std::make_shared<StaticTrustStore>(TrustEdges{edge("usa", "Fra")});
    TrustMatrix matrix(store);

    REQUIRE(matrix.has_trust("USA", "FRA"));
    REQUIRE(matrix.has_trust("usa", "fra"));
    REQUIRE_FALSE(matrix.has_trust("", "FRA"));
    REQUIRE_FALSE(matrix.has_trust("USA", ""));
}

TEST_CASE("TrustMatrix - Disabled and expired edges are absent", "[trust_matrix]") {
    auto disabled = edge("USA", "FRA");
    disabled.enabled = false;

    auto expired = edge("USA", "GBR");
    expired.expires_at = fixed_now() - std::chrono::seconds(1);

    auto expiring_exactly_now = edge("USA", "DEU");
    expiring_exactly_now.expires_at = fixed_now();

    auto future = edge("GBR", "USA");
    future.expires_at = fixed_now() + std::chrono::hours(24);

    auto store = std::make_shared<StaticTrustStore>(
        TrustEdges{disabled, expired, expiring_exactly_now, future});
    TrustMatrix matrix(store, &fixed_now);

    REQUIRE_FALSE(matrix.has_trust("USA", "FRA"));
    REQUIRE_FALSE(matrix.has_trust("USA", "GBR"));
    REQUIRE_FALSE(matrix.has_trust("USA", "DEU"));
    REQUIRE(matrix.has_trust("GBR", "USA"));
}

TEST_CASE("TrustMatrix - First matching edge decides", "[trust_matrix]") {
    auto disabled = edge("USA", "FRA");
    disabled.enabled = false;
    auto enabled = edge("USA", "FRA", {"policy:coalition"});

    TrustMatrix matrix(std::make_shared<StaticTrustStore>(TrustEdges{disabled, enabled}));
    REQUIRE_FALSE(matrix.has_trust("USA", "FRA"));
}

TEST_CASE("TrustMatrix - list_trusts_for", "[trust_matrix]") {
    auto disabled = edge("USA", "DEU");
    disabled.enabled = false;

    TrustMatrix matrix(std::make_shared<StaticTrustStore>(
        TrustEdges{edge("USA", "FRA"), edge("FRA", "USA"), edge("usa", "GBR"), disabled}));

    auto trusts = matrix.list_trusts_for("USA");
    REQUIRE(trusts.size() == 2);
    REQUIRE(trusts[0].target_instance == "FRA");
    REQUIRE(trusts[1].target_instance == "GBR");

    REQUIRE(matrix.list_trusts_for("ITA").empty());
}

TEST_CASE("TrustMatrix - Store replacement is visible to later lookups", "[trust_matrix]") {
    auto store = std::make_shared<StaticTrustStore>(TrustEdges{edge("USA", "FRA")});
    TrustMatrix matrix(store);
    REQUIRE(store->version() == 1);

    auto before = store->snapshot();
    store->replace_all(TrustEdges{edge("USA", "GBR")});

    REQUIRE(store->version() == 2);
    REQUIRE_FALSE(matrix.has_trust("USA", "FRA"));
    REQUIRE(matrix.has_trust("USA", "GBR"));

    // Readers holding the old snapshot are unaffected
    REQUIRE(before->size() == 1);
    REQUIRE(before->front().target_instance == "FRA");
}

TEST_CASE("filter_scopes_by_trust", "[trust_matrix][scopes]") {
    auto trust = edge("USA", "FRA", {"policy:base", "policy:coalition", "read:resources"});

    SECTION("keeps permitted scopes in request order") {
        auto scopes = filter_scopes_by_trust({"read:resources", "admin", "policy:base"}, trust);
        REQUIRE(scopes == std::vector<std::string>{"read:resources", "policy:base"});
    }

    SECTION("empty request yields every scope of the edge") {
        REQUIRE(filter_scopes_by_trust({}, trust) == trust.allowed_scopes);
    }

    SECTION("nothing permitted") {
        REQUIRE(filter_scopes_by_trust({"admin"}, trust).empty());
    }
}

TEST_CASE("InstanceRegistry - Lookup", "[instance_registry]") {
    InstanceConfig usa;
    usa.instance_id = "USA";
    usa.country = "USA";

    InstanceConfig fra;
    fra.instance_id = "FRA";
    fra.country = "FRA";

    InstanceConfig ita;
    ita.instance_id = "ITA";
    ita.enabled = false;

    InstanceConfig custom;
    custom.instance_id = "NATO";
    custom.clearance_mapping = {{"COSMIC_TOP_SECRET", "TOP_SECRET"}};

    InstanceRegistry registry({usa, fra, ita, custom});

    REQUIRE(registry.size() == 4);
    REQUIRE(registry.resolve("fra").has_value());
    REQUIRE(registry.resolve("FRA")->instance_id == "FRA");

    SECTION("disabled instances are known but not resolvable") {
        REQUIRE(registry.contains("ITA"));
        REQUIRE_FALSE(registry.resolve("ITA").has_value());
        REQUIRE(registry.enabled_instances().size() == 3);
    }

    SECTION("unknown instance") {
        REQUIRE_FALSE(registry.contains("ESP"));
        REQUIRE_FALSE(registry.resolve("ESP").has_value());
    }

    SECTION("national vocabulary fills an empty mapping") {
        auto resolved = registry.resolve("FRA");
        REQUIRE(resolved->clearance_mapping.at("SECRET_DEFENSE") == "SECRET");
        REQUIRE(registry.resolve("NATO")->clearance_mapping.size() == 1);
    }

    SECTION("availability for trust decisions") {
        REQUIRE(registry.is_available("fra", "USA"));
        REQUIRE_FALSE(registry.is_available("ITA", "USA"));
        REQUIRE_FALSE(registry.is_available("ESP", "USA"));
        REQUIRE_FALSE(registry.is_available("", "USA"));

        // The local instance need not register itself
        REQUIRE(registry.is_available("esp", "ESP"));
        REQUIRE_FALSE(registry.is_available("ITA", "ITA"));
    }
}
