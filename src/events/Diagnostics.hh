#ifndef DIAGNOSTICS_HH
#define DIAGNOSTICS_HH

#include "strCat.hh"

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace xmlscraper {

/** Sink for library and engine diagnostic messages.
  *
  * The library itself never prints anything, all messages go through the
  * global sink (see getGlobalDiagnostics()). By default that sink is a
  * NullDiagnostics object, install a StdioDiagnostics (or your own
  * subclass) to actually see messages.
  */
class Diagnostics
{
public:
	enum class LogLevel : uint8_t {
		INFO,
		WARNING,
		LOGLEVEL_ERROR, // ERROR may give preprocessor name clashes
		NUM // must be last
	};

	Diagnostics(const Diagnostics&) = delete;
	Diagnostics(Diagnostics&&) = delete;
	Diagnostics& operator=(const Diagnostics&) = delete;
	Diagnostics& operator=(Diagnostics&&) = delete;

	virtual ~Diagnostics() = default;

	/** Log a message with a certain priority level.
	  */
	virtual void log(LogLevel level, std::string_view message) noexcept = 0;

	// convenience methods (shortcuts for log())
	void printInfo    (std::string_view message) { log(LogLevel::INFO, message); }
	void printWarning (std::string_view message) { log(LogLevel::WARNING, message); }
	void printError   (std::string_view message) { log(LogLevel::LOGLEVEL_ERROR, message); }

	// These overloads are (only) needed for efficiency, because otherwise
	// the templated overload below is a better match than the 'string_view'
	// overload above (and we don't want to construct a temp string).
	void printInfo(const char* message) {
		printInfo(std::string_view(message));
	}
	void printWarning(const char* message) {
		printWarning(std::string_view(message));
	}
	void printError(const char* message) {
		printError(std::string_view(message));
	}

	template<typename... Args>
	void printInfo(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printInfo(std::string_view(tmp));
	}
	template<typename... Args>
	void printWarning(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printWarning(std::string_view(tmp));
	}
	template<typename... Args>
	void printError(Args&& ...args) {
		auto tmp = strCat(std::forward<Args>(args)...);
		printError(std::string_view(tmp));
	}

	[[nodiscard]] static auto getLevelStrings() {
		static constexpr std::array<std::string_view, size_t(LogLevel::NUM)> levelStr = {
			"info", "warning", "error"
		};
		return levelStr;
	}

protected:
	Diagnostics() = default;
};

[[nodiscard]] inline std::string_view toString(Diagnostics::LogLevel level)
{
	return Diagnostics::getLevelStrings()[std::to_underlying(level)];
}

/** Discards all messages. */
class NullDiagnostics final : public Diagnostics
{
public:
	void log(LogLevel /*level*/, std::string_view /*message*/) noexcept override {}
};

/** The sink used by Document parsing and the engine session.
  * Never returns nullptr: when no sink is installed a NullDiagnostics
  * instance is returned.
  */
[[nodiscard]] Diagnostics& getGlobalDiagnostics();

/** Install a new global sink, returns the previous one. Passing nullptr
  * restores the silent default. The caller keeps ownership and must keep
  * the sink alive for as long as it's installed.
  */
Diagnostics* setGlobalDiagnostics(Diagnostics* diagnostics);

} // namespace xmlscraper

#endif
