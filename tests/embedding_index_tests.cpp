#include <catch2/catch.hpp>

#include "index/EmbeddingIndex.hpp"

using namespace cardindex;

TEST_CASE("Insert keeps order and replaces in place", "[index]") {
    EmbeddingIndex idx(2);
    idx.insert("a", std::vector<float>{1.0f, 0.0f});
    idx.insert("b", std::vector<float>{0.0f, 1.0f});
    idx.insert("a", std::vector<float>{0.5f, 0.5f});

    REQUIRE(idx.size() == 2);
    REQUIRE(idx.card_ids() == std::vector<std::string>{"a", "b"});
    REQUIRE(idx.find("a")[0] == 0.5f);
    REQUIRE(idx.find("missing") == nullptr);
}

TEST_CASE("Wrong-length vectors are rejected", "[index]") {
    EmbeddingIndex idx(3);
    REQUIRE_THROWS_AS(idx.insert("a", std::vector<float>{1.0f}), std::invalid_argument);
    REQUIRE(idx.empty());
}

TEST_CASE("Erase reindexes later entries", "[index]") {
    EmbeddingIndex idx(1);
    idx.insert("a", std::vector<float>{1.0f});
    idx.insert("b", std::vector<float>{2.0f});
    idx.insert("c", std::vector<float>{3.0f});

    REQUIRE(idx.erase("a"));
    REQUIRE_FALSE(idx.erase("a"));
    REQUIRE(idx.card_ids() == std::vector<std::string>{"b", "c"});
    REQUIRE(idx.find("c")[0] == 3.0f);
    REQUIRE(idx.vector_at(0)[0] == 2.0f);

    idx.insert("c", std::vector<float>{4.0f});
    REQUIRE(idx.vector_at(1)[0] == 4.0f);

    idx.clear();
    REQUIRE(idx.empty());
    REQUIRE(idx.dim() == 1);
}

TEST_CASE("approx_equal compares ids, order and values", "[index]") {
    EmbeddingIndex a(2), b(2);
    a.insert("x", std::vector<float>{1.0f, 0.0f});
    a.insert("y", std::vector<float>{0.0f, 1.0f});
    b.insert("x", std::vector<float>{1.0f, 1e-7f});
    b.insert("y", std::vector<float>{0.0f, 1.0f});

    REQUIRE(a.approx_equal(b, 1e-6f));
    REQUIRE_FALSE(a.approx_equal(b, 0.0f));

    EmbeddingIndex c(2);
    c.insert("y", std::vector<float>{0.0f, 1.0f});
    c.insert("x", std::vector<float>{1.0f, 0.0f});
    REQUIRE_FALSE(a.approx_equal(c, 1.0f));
}
