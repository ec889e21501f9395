#include <optional>
#include <vector>
#include <catch2/catch.hpp>
#include <unipeg/unipeg.hpp>

namespace up = unipeg;

namespace {

/**
 * Counts up to a limit, reports when it's destroyed.
 */
class counting_source : public up::stream_source<int> {
private:
	int   m_Next = 0;
	int   m_Limit;
	bool* m_Destroyed;

public:
	counting_source(int limit, bool* destroyed)
		: m_Limit(limit), m_Destroyed(destroyed) {
	}

	~counting_source() override {
		*m_Destroyed = true;
	}

	std::optional<int> next() override {
		if (m_Next == m_Limit) {
			return std::nullopt;
		}
		return m_Next++;
	}
};

} /* namespace */

TEST_CASE("streams are pulled one element at a time", "[stream]") {
	bool destroyed = false;
	auto s = up::make_stream<int, counting_source>(3, &destroyed);

	SECTION("draining") {
		REQUIRE(s.next() == 0);
		REQUIRE(s.next() == 1);
		REQUIRE(s.next() == 2);
		REQUIRE_FALSE(destroyed);
		REQUIRE(s.next() == std::nullopt);
		REQUIRE(destroyed);
		REQUIRE(s.is_exhausted());
		REQUIRE(s.next() == std::nullopt);
	}

	SECTION("closing releases the producer") {
		REQUIRE(s.next() == 0);
		s.close();
		REQUIRE(destroyed);
		REQUIRE(s.next() == std::nullopt);
	}

	SECTION("range-for") {
		std::vector<int> seen;
		for (int i : s) {
			seen.push_back(i);
		}
		REQUIRE(seen == std::vector<int>{ 0, 1, 2 });
	}

	SECTION("collect") {
		REQUIRE(up::collect(std::move(s)) == std::vector<int>{ 0, 1, 2 });
		REQUIRE(destroyed);
	}
}

TEST_CASE("destroying a stream releases the producer", "[stream]") {
	bool destroyed = false;
	{
		auto s = up::make_stream<int, counting_source>(10, &destroyed);
		REQUIRE(s.next() == 0);
	}
	REQUIRE(destroyed);
}

TEST_CASE("stream helpers", "[stream]") {
	SECTION("an empty stream") {
		auto s = up::stream<int>();
		REQUIRE(s.is_exhausted());
		REQUIRE(s.next() == std::nullopt);
	}

	SECTION("single") {
		REQUIRE(up::collect(up::single(7)) == std::vector<int>{ 7 });
	}

	SECTION("generate") {
		int n = 0;
		auto s = up::generate<int>([&n]() -> std::optional<int> {
			if (n < 2) {
				return n++;
			}
			return std::nullopt;
		});
		REQUIRE(up::collect(std::move(s)) == std::vector<int>{ 0, 1 });
	}
}

TEST_CASE("a variable is bound while its stream is alive", "[stream][variable]") {
	auto v = up::variable();
	auto p = up::pattern(v);
	auto a = up::instance::item('a', 0);

	SECTION("until it's pulled past the binding") {
		auto s = p.unify(a);
		REQUIRE_FALSE(v.is_bound());
		REQUIRE(s.next().has_value());
		REQUIRE(v.is_bound());
		REQUIRE(v.unpack() == up::value('a'));
		REQUIRE_FALSE(s.next().has_value());
		REQUIRE_FALSE(v.is_bound());
	}

	SECTION("until it's closed") {
		auto s = p.unify(a);
		REQUIRE(s.next().has_value());
		s.close();
		REQUIRE_FALSE(v.is_bound());
	}

	SECTION("until it's destroyed") {
		{
			auto s = p.unify(a);
			REQUIRE(s.next().has_value());
			REQUIRE(v.is_bound());
		}
		REQUIRE_FALSE(v.is_bound());
	}

	SECTION("nested bindings unwind in order") {
		auto s1 = p.unify(a);
		REQUIRE(s1.next().has_value());
		{
			// Already bound, only checks
			auto s2 = p.unify(up::instance::item('a', 5));
			REQUIRE(s2.next().has_value());
			auto s3 = p.unify(up::instance::item('b', 6));
			REQUIRE_FALSE(s3.next().has_value());
		}
		REQUIRE(v.is_bound());
		REQUIRE(v.bound().position() == 0);
	}
}
