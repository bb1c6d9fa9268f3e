#ifndef regvm_debug_h_p2m7c5tx1e
#define regvm_debug_h_p2m7c5tx1e

#include "regvm.h"

namespace regvm
{
	enum class TraceLevelEnum
	{
		None, // nothing is recorded
		Minimal, // pc and instruction
		Standard, // + registers before and after, stack depth, compare flag
		Verbose, // + memory accesses
		Profile, // + elapsed time
	};

	struct Tracer : private Immovable
	{
		void beginInstruction(const Engine *engine);
		void endInstruction(const Engine *engine);
		void recordMemoryAccess(const MemoryAccess &access);

		TraceLevelEnum level() const;
		uint32 entriesCount() const;
		void clear();
		Holder<PointerRange<string>> report() const;
	};

	Holder<Tracer> newTracer(TraceLevelEnum level);

	struct ProfilerCreateConfig
	{
		bool trackHotInstructions = true;
		bool trackOpcodeStats = true;
		bool trackMemoryPattern = true;
	};

	struct InstructionStats
	{
		uint64 executionCount = 0;
		uint64 totalTime = 0; // microseconds
		uint64 minTime = m;
		uint64 maxTime = 0;
	};

	struct Profiler : private Immovable
	{
		void beginInstruction(const Engine *engine);
		void endInstruction(const Engine *engine);
		void recordMemoryAccess(const MemoryAccess &access);

		InstructionStats instructionStats(uint32 pc) const;
		InstructionStats opcodeStats(OpcodeEnum opcode) const;
		uint64 memoryReads(uint32 address) const;
		uint64 memoryWrites(uint32 address) const;
		Holder<PointerRange<string>> report() const;
	};

	Holder<Profiler> newProfiler(const ProfilerCreateConfig &config);

	struct VisualizerConfig
	{
		uint32 memoryStart = 0;
		uint32 memoryLength = 64;
		bool showRegisters = true;
		bool showStack = true;
		bool showMemory = true;
		bool showExecutionStats = true;
		bool compact = false; // single line
		bool colors = false; // ansi escape sequences
	};

	Holder<PointerRange<string>> visualizeState(const Engine *engine, const VisualizerConfig &config = {});

	struct DebuggerCreateConfig
	{
		ProfilerCreateConfig profilerConfig;
		string tracePath; // empty to skip saving
		string profilePath; // empty to skip saving
		TraceLevelEnum traceLevel = TraceLevelEnum::Standard;
		bool profiling = true;
	};

	// owns the tracer and the profiler and forwards the engine hooks to both
	struct Debugger : private Immovable
	{
		void beginInstruction(const Engine *engine);
		void endInstruction(const Engine *engine);
		void recordMemoryAccess(const MemoryAccess &access);
		void bind(EngineHooks &hooks);

		Tracer *tracer() const; // null when tracing is disabled
		Profiler *profiler() const; // null when profiling is disabled
		void saveReports() const;
	};

	Holder<Debugger> newDebugger(const DebuggerCreateConfig &config);
}

#endif // regvm_debug_h_p2m7c5tx1e
