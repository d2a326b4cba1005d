// Structural equality, structural hashing and the single-form parse helper.
#include "hintc/value.hpp"
#include <vector>
#include <functional>

namespace hintc {

node_ptr parse_one(std::string_view src) {
	detail::reader r(src);
	r.skip_ws();
	auto v = detail::parse_value(r);
	r.skip_ws();
	if (!r.eof()) r.fail("trailing content after single form");
	return v;
}

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_meta) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->data.index() != b->data.index()) return false;

	if (!ignore_meta) {
		if (a->metadata.size() != b->metadata.size()) return false;
		for (const auto& kv : a->metadata) {
			auto it = b->metadata.find(kv.first);
			if (it == b->metadata.end()) return false;
			if (!equal_impl(kv.second, it->second, ignore_meta)) return false;
		}
	}

	// unordered multiset comparison shared by sets and maps
	auto same_bag = [&](size_t n, size_t m, auto&& match) {
		if (n != m) return false;
		std::vector<bool> used(m);
		for (size_t i = 0; i < n; ++i) {
			bool found = false;
			for (size_t j = 0; j < m; ++j) {
				if (!used[j] && match(i, j)) { used[j] = true; found = true; break; }
			}
			if (!found) return false;
		}
		return true;
	};
	auto same_seq = [&](const std::vector<node_ptr>& l, const std::vector<node_ptr>& r) {
		if (l.size() != r.size()) return false;
		for (size_t i = 0; i < l.size(); ++i) if (!equal_impl(l[i], r[i], ignore_meta)) return false;
		return true;
	};

	switch (a->data.index()) {
	case 0: return true;
	case 1: return std::get<bool>(a->data) == std::get<bool>(b->data);
	case 2: return std::get<int64_t>(a->data) == std::get<int64_t>(b->data);
	case 3: return std::get<double>(a->data) == std::get<double>(b->data);
	case 4: return std::get<std::string>(a->data) == std::get<std::string>(b->data);
	case 5: return std::get<keyword>(a->data).name == std::get<keyword>(b->data).name;
	case 6: return std::get<symbol>(a->data).name == std::get<symbol>(b->data).name;
	case 7: return same_seq(std::get<list>(a->data).elems, std::get<list>(b->data).elems);
	case 8: return same_seq(std::get<vector_t>(a->data).elems, std::get<vector_t>(b->data).elems);
	case 9: {
		const auto& le = std::get<set>(a->data).elems;
		const auto& re = std::get<set>(b->data).elems;
		return same_bag(le.size(), re.size(), [&](size_t i, size_t j) { return equal_impl(le[i], re[j], ignore_meta); });
	}
	case 10: {
		const auto& lm = std::get<map>(a->data).entries;
		const auto& rm = std::get<map>(b->data).entries;
		return same_bag(lm.size(), rm.size(), [&](size_t i, size_t j) {
			return equal_impl(lm[i].first, rm[j].first, ignore_meta) && equal_impl(lm[i].second, rm[j].second, ignore_meta);
		});
	}
	case 11: {
		const auto& lt = std::get<tagged_value>(a->data);
		const auto& rt = std::get<tagged_value>(b->data);
		return lt.tag.name == rt.tag.name && equal_impl(lt.inner, rt.inner, ignore_meta);
	}
	case 12: {
		// two host callables are the same value only when they carry the same non-empty name
		const auto& lf = std::get<native_fn>(a->data);
		const auto& rf = std::get<native_fn>(b->data);
		return !lf.name.empty() && lf.name == rf.name;
	}
	}
	return false;
}

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_metadata) { return equal_impl(a, b, ignore_metadata); }

static size_t mix(size_t seed, size_t v) { return seed ^ (v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2)); }

size_t hash_value(const node_ptr& n) {
	if (!n) return 0;
	size_t h = std::hash<size_t>{}(n->data.index());
	switch (n->data.index()) {
	case 0: return h;
	case 1: return mix(h, std::get<bool>(n->data) ? 1 : 0);
	case 2: return mix(h, std::hash<int64_t>{}(std::get<int64_t>(n->data)));
	case 3: {
		double d = std::get<double>(n->data);
		if (d == 0.0) d = 0.0; // -0.0 == 0.0
		return mix(h, std::hash<double>{}(d));
	}
	case 4: return mix(h, std::hash<std::string>{}(std::get<std::string>(n->data)));
	case 5: return mix(h, std::hash<std::string>{}(std::get<keyword>(n->data).name));
	case 6: return mix(h, std::hash<std::string>{}(std::get<symbol>(n->data).name));
	case 7: for (auto& e : std::get<list>(n->data).elems) h = mix(h, hash_value(e)); return h;
	case 8: for (auto& e : std::get<vector_t>(n->data).elems) h = mix(h, hash_value(e)); return h;
	case 9: {
		// order-independent: sum of element hashes
		size_t acc = 0;
		for (auto& e : std::get<set>(n->data).elems) acc += hash_value(e);
		return mix(h, acc);
	}
	case 10: {
		size_t acc = 0;
		for (auto& kv : std::get<map>(n->data).entries) acc += mix(hash_value(kv.first), hash_value(kv.second));
		return mix(h, acc);
	}
	case 11: {
		const auto& tv = std::get<tagged_value>(n->data);
		return mix(mix(h, std::hash<std::string>{}(tv.tag.name)), hash_value(tv.inner));
	}
	case 12: return mix(h, std::hash<std::string>{}(std::get<native_fn>(n->data).name));
	}
	return h;
}

} // namespace hintc
