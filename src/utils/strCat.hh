#ifndef STRCAT_HH
#define STRCAT_HH

#include <charconv>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// strCat and strAppend()
//
// Concatenate a bunch of 'printable' objects into a single std::string:
//      auto s = strCat("Invalid XPath expression '", expr, "' at line ", line);
//
// The result is allocated once with the exact final size. Integral and
// floating point values are formatted with std::to_chars (so no locale and
// no temporary std::string objects).
template<typename... Ts>
[[nodiscard]] std::string strCat(Ts&& ...ts);

// Append a bunch of 'printable' objects to an existing string.
// It's not allowed to append (a part of) a string to itself.
template<typename... Ts>
void strAppend(std::string& result, Ts&& ...ts);


// --- Implementation details ---

namespace strCatImpl {

// ConcatUnit
// Each unit knows its exact formatted size and can copy itself into a
// pre-sized buffer:
// - size_t size() const;
// - char* copy(char* dst) const;
struct ConcatView
{
	explicit ConcatView(std::string_view v_) : v(v_) {}

	[[nodiscard]] size_t size() const { return v.size(); }
	[[nodiscard]] char* copy(char* dst) const
	{
		return std::char_traits<char>::copy(dst, v.data(), v.size()) + v.size();
	}

private:
	std::string_view v;
};

struct ConcatChar
{
	explicit ConcatChar(char c_) : c(c_) {}

	[[nodiscard]] size_t size() const { return 1; }
	[[nodiscard]] char* copy(char* dst) const { *dst = c; return dst + 1; }

private:
	char c;
};

// Integers and doubles are first formatted into a small local buffer.
struct ConcatNumber
{
	template<typename T>
	explicit ConcatNumber(T t)
	{
		auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), t);
		len = (ec == std::errc()) ? size_t(p - buf) : 0;
	}

	[[nodiscard]] size_t size() const { return len; }
	[[nodiscard]] char* copy(char* dst) const
	{
		return std::char_traits<char>::copy(dst, buf, len) + len;
	}

private:
	char buf[32];
	size_t len;
};

[[nodiscard]] inline auto makeConcatUnit(std::string_view v) { return ConcatView(v); }
[[nodiscard]] inline auto makeConcatUnit(const std::string& s) { return ConcatView(s); }
[[nodiscard]] inline auto makeConcatUnit(const char* s) { return ConcatView(s ? s : ""); }
[[nodiscard]] inline auto makeConcatUnit(char* s) { return ConcatView(s ? s : ""); }
[[nodiscard]] inline auto makeConcatUnit(char c) { return ConcatChar(c); }
[[nodiscard]] inline auto makeConcatUnit(bool b) { return ConcatView(b ? "true" : "false"); }

template<typename T>
	requires(std::integral<T> || std::floating_point<T>)
[[nodiscard]] inline auto makeConcatUnit(T t) { return ConcatNumber(t); }

template<typename... Units>
[[nodiscard]] size_t calcTotalSize(const Units& ...units)
{
	return (size_t(0) + ... + units.size());
}

template<typename... Units>
void copyUnits(char* dst, const Units& ...units)
{
	((dst = units.copy(dst)), ...);
}

} // namespace strCatImpl

template<typename... Ts>
std::string strCat(Ts&& ...ts)
{
	std::string result;
	strAppend(result, std::forward<Ts>(ts)...);
	return result;
}

template<typename... Ts>
void strAppend(std::string& result, Ts&& ...ts)
{
	[&](auto&& ...units) {
		auto oldSize = result.size();
		result.resize(oldSize + strCatImpl::calcTotalSize(units...));
		strCatImpl::copyUnits(result.data() + oldSize, units...);
	}(strCatImpl::makeConcatUnit(ts)...);
}

#endif
