#ifndef ENGINESESSION_HH
#define ENGINESESSION_HH

namespace xmlscraper::engine {

/** Process-wide state of the XML engine.
  *
  * The engine globals are initialized once, on first use. Every Document
  * holds a Use object for as long as it owns a tree. A cleanup() request
  * releases the engine globals immediately when no Document is alive,
  * otherwise it's delayed until the last Use is released.
  *
  * All methods are thread-safe.
  */
class EngineSession
{
public:
	class Use
	{
	public:
		Use();
		~Use();

		Use(const Use&) = delete;
		Use(Use&&) = delete;
		Use& operator=(const Use&) = delete;
		Use& operator=(Use&&) = delete;
	};

	EngineSession() = delete;

	static void init();
	static void cleanup();

	[[nodiscard]] static bool isInitialized();
	[[nodiscard]] static unsigned getUseCount();
	[[nodiscard]] static bool isCleanupPending();
};

} // namespace xmlscraper::engine

#endif
