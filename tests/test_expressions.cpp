#include <cctype>
#include <sstream>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include <unipeg/unipeg.hpp>

namespace up = unipeg;

using up::instance;

namespace {

/**
 * Every derivation in printed form, so that enumerations can be compared.
 */
std::vector<std::string> show(up::derivations ds) {
	std::vector<std::string> res;
	for (auto const& d : ds) {
		std::ostringstream os;
		os << d;
		res.push_back(os.str());
	}
	return res;
}

std::vector<std::string> show(up::expr const& e, std::string const& src,
	std::size_t pos = 0) {
	return show(e.derive(src, pos));
}

up::value chars(std::string const& s) {
	up::value_list res;
	for (auto c : s) {
		res.push_back(c);
	}
	return res;
}

} /* namespace */

TEST_CASE("'ret' succeeds without consuming", "[expr][ret]") {
	auto e = up::ret(instance::object(1));
	REQUIRE(show(e, "abc", 1) == std::vector<std::string>{ "(1, 1)" });
	REQUIRE(show(up::epsilon, "") == std::vector<std::string>{ "(Empty, 0)" });
}

TEST_CASE("'zero' never succeeds", "[expr][zero]") {
	REQUIRE(show(up::zero, "abc").empty());
	REQUIRE(show(up::zero, "").empty());
}

TEST_CASE("'element' consumes anything", "[expr][element]") {
	REQUIRE(show(up::element, "ab", 1)
		== std::vector<std::string>{ "(<'b' at 1>, 2)" });
	REQUIRE(show(up::element, "ab", 2).empty());

	SECTION("starting past the end yields nothing") {
		REQUIRE(show(up::element, "ab", 3).empty());
		REQUIRE(show(up::item('a') + up::item('b'), "ab", 5).empty());
	}
}

TEST_CASE("'end_of_input' matches only at the end", "[expr][end]") {
	REQUIRE(show(up::end_of_input, "ab", 2)
		== std::vector<std::string>{ "(<End at 2>, 2)" });
	REQUIRE(show(up::end_of_input, "ab", 1).empty());

	SECTION("the marker disappears in sequences") {
		auto e = up::item('a') + up::end_of_input;
		REQUIRE(show(e, "a") == std::vector<std::string>{ "(<'a' at 0>, 1)" });
		REQUIRE(show(e, "ab").empty());
	}
}

TEST_CASE("'item' consumes a matching element", "[expr][item]") {
	auto e = up::item('a');

	SECTION("there is an element and it matches") {
		auto ds = up::collect(e.derive("a"));
		REQUIRE(ds.size() == 1);
		REQUIRE(ds[0].result.unpack() == up::value('a'));
		REQUIRE(ds[0].position == 1);
	}

	SECTION("there is an element and it doesn't match") {
		REQUIRE(show(e, "b").empty());
	}

	SECTION("there is no element") {
		REQUIRE(show(e, "").empty());
	}

	SECTION("a non-deterministic pattern succeeds more than once") {
		auto twice = up::item(up::either(up::anything, up::label("x")));
		REQUIRE(show(twice, "a") == std::vector<std::string>{
			"(<'a' at 0>, 1)",
			"(<x: <'a' at 0>>, 1)"
		});
	}
}

TEST_CASE("'when' consumes an element satisfying a predicate", "[expr][item]") {
	auto digit = up::when([](up::value const& v) {
		return v.is<char>()
			&& std::isdigit(static_cast<unsigned char>(v.as<char>())) != 0;
	});
	REQUIRE(show(digit, "7x") == std::vector<std::string>{ "(<'7' at 0>, 1)" });
	REQUIRE(show(digit, "x7").empty());
	REQUIRE(show(digit, "").empty());
}

TEST_CASE("deriving is lazy", "[expr]") {
	int calls = 0;
	auto e = up::element >>= [&calls](instance const& i) {
		++calls;
		return up::ret(i);
	};
	std::string src = "ab";
	auto ds = e.derive(src);
	REQUIRE(calls == 0);
	REQUIRE(ds.next().has_value());
	REQUIRE(calls == 1);
}

TEST_CASE("chaining combines results", "[expr][chain]") {
	auto ab = up::item('a') + up::item('b');

	SECTION("both match") {
		auto ds = up::collect(ab.derive("ab"));
		REQUIRE(ds.size() == 1);
		REQUIRE(ds[0].result.unpack() == chars("ab"));
		REQUIRE(ds[0].position == 2);
	}

	SECTION("the second one is missing") {
		REQUIRE(show(ab, "a").empty());
	}

	SECTION("the first one doesn't match") {
		REQUIRE(show(ab, "bb").empty());
	}

	SECTION("sequences stay flat") {
		auto abc = (up::item('a') + up::item('b')) + up::item('c');
		auto ds = up::collect(abc.derive("abc"));
		REQUIRE(ds.size() == 1);
		auto const& r = ds[0].result;
		REQUIRE(r.is_sequence());
		REQUIRE(r.items().size() == 3);
		for (auto const& i : r.items()) {
			REQUIRE_FALSE(i.is_sequence());
		}
		REQUIRE(show(abc, "abc")
			== show(up::item('a') + (up::item('b') + up::item('c')), "abc"));
	}

	SECTION("Empty is absorbed") {
		REQUIRE(show(up::epsilon + up::item('a'), "a") == show(up::item('a'), "a"));
		REQUIRE(show(up::item('a') + up::epsilon, "a") == show(up::item('a'), "a"));
	}
}

TEST_CASE("the monad laws hold", "[expr][bind]") {
	std::string src = "aab";
	auto p = up::some(up::item('a'));
	auto f = [](instance const& i) {
		return up::item(i.unpack());
	};
	auto g = [](instance const&) {
		return up::ret(instance::object(std::string("ok")));
	};

	SECTION("right identity") {
		auto bound = up::bind(p, [](instance const& i) { return up::ret(i); });
		REQUIRE(show(bound, src) == show(p, src));
		REQUIRE_FALSE(show(p, src).empty());
	}

	SECTION("left identity") {
		auto x = instance::item('a', 0);
		REQUIRE(show(up::ret(x) >>= f, src) == show(f(x), src));
	}

	SECTION("associativity") {
		auto e = up::element;
		auto left = (e >>= f) >>= g;
		auto right = e >>= [f, g](instance const& a) {
			return f(a) >>= g;
		};
		REQUIRE(show(left, src) == show(right, src));
		REQUIRE(show(left, src) == std::vector<std::string>{ "(\"ok\", 2)" });
	}
}

TEST_CASE("alternatives enumerate left then right", "[expr][alt]") {
	auto a = up::item('a');
	auto b = up::item('b');

	SECTION("Scenario: either character") {
		auto e = a | b;
		REQUIRE(show(e, "b") == std::vector<std::string>{ "(<'b' at 0>, 1)" });
		REQUIRE(show(e, "c").empty());
	}

	SECTION("both alternatives match") {
		auto e = up::item('a') | up::element;
		REQUIRE(show(e, "a") == std::vector<std::string>{
			"(<'a' at 0>, 1)",
			"(<'a' at 0>, 1)"
		});
	}

	SECTION("zero is the identity") {
		auto p = up::some(a);
		REQUIRE(show(p | up::zero, "aaa") == show(p, "aaa"));
		REQUIRE(show(up::zero | p, "aaa") == show(p, "aaa"));
	}

	SECTION("associativity") {
		auto c = up::element;
		REQUIRE(show((a | b) | c, "a") == show(a | (b | c), "a"));
	}

	SECTION("distributes over chaining") {
		auto p = up::some(a);
		auto q = up::element;
		auto f = up::item('a') | up::item('b');
		REQUIRE(show((p | q) + f, "aab") == show((p + f) | (q + f), "aab"));
		REQUIRE(show((p | q) + f, "aab").size() == 3);
	}
}

TEST_CASE("variables are scoped to their enumeration", "[expr][variable]") {
	auto v = up::variable();

	SECTION("a failed branch releases its binding") {
		bool bound_inside = false;
		bool bound_sibling = true;
		auto probe_inside = up::epsilon >>= [&](instance const&) {
			bound_inside = v.is_bound();
			return up::zero;
		};
		auto probe_sibling = up::epsilon >>= [&](instance const&) {
			bound_sibling = v.is_bound();
			return up::epsilon;
		};
		auto e = ((up::element >> v) + probe_inside) | probe_sibling;
		REQUIRE(show(e, "a").size() == 1);
		REQUIRE(bound_inside);
		REQUIRE_FALSE(bound_sibling);
		REQUIRE_FALSE(v.is_bound());
	}

	SECTION("the same variable twice") {
		auto e = (up::element >> v) + (up::element >> v);
		REQUIRE(show(e, "ab").empty());
		REQUIRE(show(e, "aa").size() == 1);
		REQUIRE_FALSE(v.is_bound());
	}

	SECTION("abandoning the enumeration releases the binding") {
		std::string src = "ab";
		auto e = (up::element >> v) + up::element;
		auto ds = e.derive(src);
		REQUIRE(ds.next().has_value());
		REQUIRE(v.is_bound());
		REQUIRE(v.unpack() == up::value('a'));
		ds.close();
		REQUIRE_FALSE(v.is_bound());
	}

	SECTION("destroying the enumeration releases the binding") {
		std::string src = "ab";
		{
			auto ds = (up::element >> v).derive(src);
			REQUIRE(ds.next().has_value());
			REQUIRE(v.is_bound());
		}
		REQUIRE_FALSE(v.is_bound());
	}
}

TEST_CASE("'ahead' looks without consuming", "[expr][ahead]") {
	auto e = up::ahead(up::item('a'));
	REQUIRE(show(e, "ab") == std::vector<std::string>{ "(Empty, 0)" });
	REQUIRE(show(e, "ba").empty());
	REQUIRE(show(e + up::element, "ab")
		== std::vector<std::string>{ "(<'a' at 0>, 1)" });

	SECTION("only the first derivation counts") {
		auto twice = up::ahead(up::item('a') | up::item('a'));
		REQUIRE(show(twice, "a").size() == 1);
	}

	SECTION("bindings don't leak out") {
		auto v = up::variable();
		bool bound = true;
		auto probe = up::epsilon >>= [&](instance const&) {
			bound = v.is_bound();
			return up::epsilon;
		};
		REQUIRE(show(up::ahead(up::element >> v) + probe, "a").size() == 1);
		REQUIRE_FALSE(bound);
	}
}

TEST_CASE("'locate' unifies the starting position", "[expr][locate]") {
	SECTION("with a constant") {
		auto e = up::element ^ std::size_t(1);
		REQUIRE(show(e, "ab").empty());
		REQUIRE(show(up::element + e, "ab").size() == 1);
	}

	SECTION("with a plain integer") {
		auto e = up::element ^ 1;
		REQUIRE(show(e, "ab").empty());
		REQUIRE(show(up::element + e, "ab").size() == 1);
		REQUIRE(show(up::locate(up::element, 0), "ab").size() == 1);
	}

	SECTION("with a variable") {
		auto at = up::variable();
		std::string src = "xy";
		auto ds = (up::element + (up::element ^ at)).derive(src);
		auto d = ds.next();
		REQUIRE(d.has_value());
		REQUIRE(d->result.unpack() == chars("xy"));
		REQUIRE(at.unpack() == up::value(std::size_t(1)));
		REQUIRE_FALSE(ds.next().has_value());
		REQUIRE_FALSE(at.is_bound());
	}
}

TEST_CASE("unification filters and transforms derivations", "[expr][unify]") {
	SECTION("rejecting") {
		auto e = up::element >> 'a';
		REQUIRE(show(e, "a").size() == 1);
		REQUIRE(show(e, "b").empty());
	}

	SECTION("labeling") {
		auto e = (up::item('a') + up::item('b')) >> up::label("ab");
		REQUIRE(show(e, "ab") == std::vector<std::string>{
			"(<ab: Sequence([<'a' at 0>, <'b' at 1>])>, 2)"
		});
	}

	SECTION("Scenario: constructing an object from bindings") {
		struct pair_node {
			char left;
			char right;
		};

		int calls = 0;
		auto l = up::variable();
		auto r = up::variable();
		auto e = ((up::element >> l) + (up::element >> r)) >> up::make(
			[&calls](up::named_args const& args) {
				++calls;
				return pair_node{
					args.get<char>("left"), args.get<char>("right")
				};
			},
			{ { "left", l }, { "right", r } }
		);

		auto ds = up::collect(e.derive("xy"));
		REQUIRE(ds.size() == 1);
		REQUIRE(calls == 1);
		REQUIRE(ds[0].position == 2);
		auto const& node = ds[0].result.get_value().as<pair_node>();
		REQUIRE(node.left == 'x');
		REQUIRE(node.right == 'y');
	}
}

TEST_CASE("greedy repetition commits to the first derivation", "[expr][repeat]") {
	SECTION("star") {
		auto e = up::star(up::item('a'));
		REQUIRE(show(e, "aab") == std::vector<std::string>{
			"(Sequence([<'a' at 0>, <'a' at 1>]), 2)"
		});
		REQUIRE(show(e, "b") == std::vector<std::string>{ "(Empty, 0)" });
	}

	SECTION("plus") {
		auto e = up::plus(up::item('a'));
		REQUIRE(show(e, "ab") == std::vector<std::string>{ "(<'a' at 0>, 1)" });
		REQUIRE(show(e, "b").empty());
	}

	SECTION("no backtracking into the steps") {
		auto e = up::star(up::item('a')) + up::item('a');
		REQUIRE(show(e, "aa").empty());
	}

	SECTION("a step consuming nothing ends the repetition") {
		REQUIRE(show(up::star(up::epsilon), "ab")
			== std::vector<std::string>{ "(Empty, 0)" });
		REQUIRE(show(up::plus(up::many(up::item('a'))), "b").size() == 1);
	}

	SECTION("bindings of the steps outlive the repetition") {
		auto v = up::variable();
		std::string src = "aab";
		auto ds = up::star(up::element >> v).derive(src);
		auto d = ds.next();
		REQUIRE(d.has_value());
		// The binding made by the first step constrains the following ones
		REQUIRE(d->position == 2);
		REQUIRE(v.is_bound());
		REQUIRE(v.unpack() == up::value('a'));
		REQUIRE_FALSE(ds.next().has_value());
		REQUIRE_FALSE(v.is_bound());
	}

	SECTION("manual release") {
		auto v = up::variable();
		std::string src = "ab";
		auto ds = up::plus(up::element >> v).derive(src);
		REQUIRE(ds.next().has_value());
		REQUIRE(v.is_bound());
		v.unbind();
		REQUIRE_FALSE(v.is_bound());
	}
}

TEST_CASE("backtracking repetition yields every length", "[expr][some]") {
	SECTION("longest first") {
		REQUIRE(show(up::some(up::item('a')), "aaa") == std::vector<std::string>{
			"(Sequence([<'a' at 0>, <'a' at 1>, <'a' at 2>]), 3)",
			"(Sequence([<'a' at 0>, <'a' at 1>]), 2)",
			"(<'a' at 0>, 1)"
		});
	}

	SECTION("Scenario: repeated alternatives") {
		auto ds = up::collect(
			up::some(up::item('a') | up::item('b')).derive("ab")
		);
		bool found = false;
		for (auto const& d : ds) {
			if (d.position == 2 && d.result.unpack() == chars("ab")) {
				found = true;
			}
		}
		REQUIRE(found);
	}

	SECTION("some needs one, many doesn't") {
		REQUIRE(show(up::some(up::item('a')), "b").empty());
		REQUIRE(show(up::many(up::item('a')), "b")
			== std::vector<std::string>{ "(Empty, 0)" });
	}

	SECTION("backtracks into the steps") {
		auto e = up::some(up::item('a')) + up::item('a');
		REQUIRE(show(e, "aa") == std::vector<std::string>{
			"(Sequence([<'a' at 0>, <'a' at 1>]), 2)"
		});
	}

	SECTION("an empty-matching body terminates") {
		REQUIRE(show(up::some(up::epsilon), "a").size() == 1);
	}
}

TEST_CASE("'one_of' consumes a member of a set", "[expr][one_of]") {
	auto vowels = up::choice_set("aeiou");
	auto e = up::one_of(vowels);
	REQUIRE(show(e, "e") == std::vector<std::string>{ "(<'e' at 0>, 1)" });
	REQUIRE(show(e, "x").empty());

	SECTION("set operations") {
		auto ab = up::choice_set("ab");
		auto bc = up::choice_set("bc");
		REQUIRE((ab | bc) == up::choice_set("abc"));
		REQUIRE((ab & bc) == up::choice_set("b"));
		REQUIRE((ab - bc) == up::choice_set("a"));
		REQUIRE((ab ^ bc) == up::choice_set("ac"));
		REQUIRE(up::choice_set("aab").size() == 2);
		REQUIRE(show(up::one_of(ab - bc), "b").empty());
	}

	SECTION("sets of other values") {
		auto digits = up::choice_set{ 1, 2, 3 };
		std::vector<int> src{ 3, 4 };
		REQUIRE(up::collect(up::one_of(digits).derive(src)).size() == 1);
		REQUIRE(up::collect(up::one_of(digits).derive(src, 1)).empty());
	}
}
