/*
 * Copyright 2025 TierOne Software
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
#include <catch2/catch_approx.hpp>
#include <bugsift/k8s/namespaces.hpp>

using namespace bugsift::k8s;
using Catch::Approx;

namespace {

constexpr std::string_view RESOURCES = R"(apiVersion: v1
kind: Pod
metadata:
  name: checkout-7d9f
  namespace: shop
  labels:
    app: checkout
spec:
  containers:
  - name: checkout
    resources:
      requests:
        cpu: 250m
        memory: 512Mi
      limits:
        cpu: "1"
        memory: 1Gi
  - name: istio-proxy
    resources:
      requests:
        cpu: 100m
        memory: 128Mi
      limits:
        cpu: 2000m
        memory: 1Gi
---
apiVersion: v1
kind: Service
metadata:
  name: checkout
  namespace: shop
---
apiVersion: v1
kind: List
items:
- apiVersion: v1
  kind: Pod
  metadata:
    name: cart-1
    namespace: shop
    labels:
      app.kubernetes.io/name: cart
  spec:
    containers:
    - name: cart
      resources:
        requests:
          cpu: "0.5"
          memory: 1Gi
- apiVersion: v1
  kind: Pod
  metadata:
    name: checkout-8a1b
    namespace: shop
    labels:
      app: checkout
  spec:
    containers:
    - name: checkout
- apiVersion: v1
  kind: ConfigMap
  metadata:
    name: settings
    namespace: shop
- apiVersion: v1
  kind: Pod
  metadata:
    name: coredns-1
    namespace: kube-system
  spec:
    containers:
    - name: coredns
      resources:
        requests:
          cpu: 100m
          memory: 70Mi
---
this: is: not: valid
---
kind: Pod
metadata:
  name: orphan
spec:
  containers: []
)";

} // anonymous namespace

TEST_CASE("Namespace rows from a resource dump", "[namespaces]") {
    const auto rows = extract_namespace_rows("prod-east", RESOURCES);
    REQUIRE(rows.size() == 3);

    SECTION("First-seen order") {
        CHECK(rows[0].namespace_name == "shop");
        CHECK(rows[1].namespace_name == "kube-system");
        CHECK(rows[2].namespace_name == "default");
        for (const auto& row : rows) {
            CHECK(row.cluster == "prod-east");
        }
    }

    SECTION("Workload totals") {
        const auto& shop = rows[0];
        CHECK(shop.pods == 3);
        CHECK(shop.containers == 4);
        CHECK(shop.services == 2);
        CHECK(shop.req_cores == Approx(0.85));
        CHECK(shop.req_mem_gib == Approx(1.625));
        CHECK(shop.limit_cores == Approx(3.0));
        CHECK(shop.limit_mem_gib == Approx(2.0));
    }

    SECTION("Sidecar overhead") {
        const auto& shop = rows[0];
        CHECK(shop.sidecar_proxies == 1);
        CHECK(shop.sidecar_req_cpu == Approx(0.1));
        CHECK(shop.sidecar_req_mem_gib == Approx(0.125));
        CHECK(shop.sidecar_limit_cpu == Approx(2.0));
        CHECK(shop.sidecar_limit_mem_gib == Approx(1.0));

        CHECK(rows[1].sidecar_proxies == 0);
        CHECK(rows[1].sidecar_req_cpu == 0.0);

        for (const auto& row : rows) {
            CHECK(row.req_cores >= row.sidecar_req_cpu);
            CHECK(row.req_mem_gib >= row.sidecar_req_mem_gib);
        }
    }

    SECTION("Rounded to four places") {
        // 70Mi is 0.068359375 GiB
        CHECK(rows[1].req_mem_gib == Approx(0.0684));
        CHECK(rows[1].services == 0);
    }

    SECTION("Pod without containers") {
        CHECK(rows[2].pods == 1);
        CHECK(rows[2].containers == 0);
        CHECK(rows[2].req_cores == 0.0);
    }
}

TEST_CASE("Nothing to aggregate", "[namespaces]") {
    CHECK(extract_namespace_rows("c", "").empty());
    CHECK(extract_namespace_rows("c", "kind: Service\nmetadata:\n  name: x\n").empty());
    CHECK(extract_namespace_rows("c", "[[[").empty());
}

TEST_CASE("Document splitting", "[namespaces]") {
    const auto documents = split_yaml_documents("a: 1\n---\n\n---\nb: 2\n--- \nc: 3\n---");
    REQUIRE(documents.size() == 2);
    CHECK(documents[0] == "a: 1");
    // "--- " is not a separator line
    CHECK(documents[1] == "b: 2\n--- \nc: 3");

    CHECK(split_yaml_documents("").empty());
    CHECK(split_yaml_documents("---\n---\n").empty());
    REQUIRE(split_yaml_documents("---\nkind: Pod").size() == 1);
}
