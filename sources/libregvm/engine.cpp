#include <cage-core/math.h>

#include "machine.h"

#include <optional>

namespace regvm
{
	namespace
	{
		constexpr uint32 HotPathPeriod = 1000; // maintenance runs whenever pc lands on a multiple of this
		constexpr uint64 HotPathThreshold = 1000; // addresses executed more often than this get cached

		void validateConfig(const EngineCreateConfig &config)
		{
			if (config.limits.memorySize == 0)
			{
				CAGE_THROW_ERROR(VmError, "invalid memory size", ErrorKindEnum::InvalidConfiguration,
					ErrorContext{ "creating engine", "memory size is zero", "configure at least 4 bytes of memory" });
			}
			if (config.limits.stackCapacity == 0)
			{
				CAGE_THROW_ERROR(VmError, "invalid stack capacity", ErrorKindEnum::InvalidConfiguration,
					ErrorContext{ "creating engine", "stack capacity is zero", "configure a positive stack capacity" });
			}
			if (config.limits.maxSteps == 0)
			{
				CAGE_THROW_ERROR(VmError, "invalid steps limit", ErrorKindEnum::InvalidConfiguration,
					ErrorContext{ "creating engine", "steps limit is zero", "configure a positive steps limit or leave it unlimited" });
			}
		}
	}

	struct EngineImpl : public Engine, public MachineState
	{
		EngineCreateConfig config;

		EngineStateEnum state = EngineStateEnum::Idle;
		std::vector<uint64> executionCounts; // indexed by pc
		std::vector<std::optional<Operation>> hotCache; // indexed by pc
		std::optional<Instruction> lastInstruction;
		uint64 stepIndex_ = 0;
		uint32 hotCount = 0;

		EngineImpl(const EngineCreateConfig &config) : config(config)
		{
			validateConfig(config);
			memory_.resize(config.limits.memorySize, 0);
			stackCapacity = config.limits.stackCapacity;
			memoryAccess = config.hooks.memoryAccess;
			CAGE_LOG(SeverityEnum::Info, "regvm", stringizer() + "engine initialized with " + config.limits.memorySize + " bytes of memory");
		}

		~EngineImpl()
		{
			CAGE_LOG(SeverityEnum::Info, "regvm", "engine shutting down");
		}

		void load(PointerRange<const Instruction> program)
		{
			if (state == EngineStateEnum::Running)
			{
				CAGE_THROW_ERROR(VmError, "engine is running", ErrorKindEnum::InvalidInstruction,
					ErrorContext{ "loading program", "cannot replace the program of a running engine", "load programs before or after running" });
			}
			if (program.empty())
			{
				CAGE_THROW_ERROR(VmError, "empty program", ErrorKindEnum::InvalidInstruction,
					ErrorContext{ "loading program", "program is empty", "provide at least one instruction" });
			}
			// registers, memory, stack and the compare flag persist across loads
			program_ = program;
			programCounter_ = 0;
			stepIndex_ = 0;
			lastInstruction.reset();
			executionCounts.clear();
			executionCounts.resize(program.size(), 0);
			hotCache.clear();
			hotCache.resize(program.size());
			hotCount = 0;
			state = EngineStateEnum::Loaded;
			CAGE_LOG(SeverityEnum::Info, "regvm", stringizer() + "program loaded: " + (uint64)program.size() + " instructions");
		}

		void logInstruction(const Instruction &inst) const
		{
			CAGE_LOG(SeverityEnum::Hint, "regvm", stringizer() + "executing: " + instructionToString(inst) + " at pc " + programCounter_);
			string regs;
			for (uint32 i = 0; i < RegistersCount; i++)
				if (registers_[i] != 0)
					regs += stringizer() + "R" + i + "=" + registers_[i] + " ";
			CAGE_LOG(SeverityEnum::Hint, "regvm", stringizer() + "registers: " + regs);
			if (!stack_.empty())
				CAGE_LOG(SeverityEnum::Hint, "regvm", stringizer() + "stack depth: " + (uint64)stack_.size() + ", top: " + stack_.back());
		}

		void logMemoryDump(uint32 start, uint32 length) const
		{
			const uint32 end = min(start + length, numeric_cast<uint32>(memory_.size()));
			string line;
			for (uint32 i = start; i < end; i++)
				line += stringizer() + (uint32)memory_[i] + " ";
			CAGE_LOG(SeverityEnum::Hint, "regvm", stringizer() + "memory [" + start + ".." + end + "]: " + line);
		}

		void optimizeHotPaths()
		{
			uint32 added = 0;
			for (uint32 pc = 0; pc < executionCounts.size(); pc++)
			{
				if (executionCounts[pc] > HotPathThreshold && !hotCache[pc])
				{
					hotCache[pc] = decode(program_[pc]);
					added++;
				}
			}
			if (added > 0)
			{
				hotCount += added;
				CAGE_LOG(SeverityEnum::Note, "regvm", stringizer() + "cached " + added + " hot instructions, " + hotCount + " in total");
			}
		}

		Operation fetch() const
		{
			const std::optional<Operation> &cached = hotCache[programCounter_];
			if (cached)
				return *cached;
			return decode(program_[programCounter_]);
		}

		void step()
		{
			CAGE_ASSERT(state == EngineStateEnum::Running);
			if (stepIndex_ >= config.limits.maxSteps)
			{
				CAGE_THROW_ERROR(VmError, "steps limit reached", ErrorKindEnum::ResourceExhausted,
					ErrorContext{ "executing program", stringizer() + "executed " + stepIndex_ + " instructions without halting", "check for infinite loops or raise the steps limit" });
			}

			if (config.hooks.beginInstruction)
				config.hooks.beginInstruction(this);

			const uint32 pc = programCounter_;
			const Operation op = fetch();
			if (config.debugMode)
				logInstruction(program_[pc]);
			jumped = false;
			dispatch(*this, op);
			executionCounts[pc]++;
			stepIndex_++;
			lastInstruction = program_[pc];

			if (config.hooks.endInstruction)
				config.hooks.endInstruction(this);

			if (!running)
				return; // halt leaves the pc at the halt instruction
			if (!jumped)
				programCounter_++;
			if (programCounter_ % HotPathPeriod == 0)
			{
				optimizeHotPaths();
				if (config.debugMode)
					logMemoryDump(0, 64);
			}
		}

		void run()
		{
			if (state != EngineStateEnum::Loaded)
			{
				CAGE_THROW_ERROR(VmError, "no program loaded", ErrorKindEnum::InvalidInstruction,
					ErrorContext{ "executing program", stringizer() + "engine is " + engineStateName(state) + " instead of loaded", "load a program before running it" });
			}
			state = EngineStateEnum::Running;
			running = true;
			try
			{
				while (running && programCounter_ < program_.size())
					step();
			}
			catch (VmError &e)
			{
				if (!e.context.location)
				{
					SourceLocation loc;
					loc.line = programCounter_ + 1;
					e.context.location = loc;
				}
				running = false;
				state = EngineStateEnum::Failed;
				throw;
			}
			catch (...)
			{
				running = false;
				state = EngineStateEnum::Failed;
				throw;
			}
			running = false;
			state = EngineStateEnum::Halted;
		}
	};

	Holder<Engine> newEngine(const EngineCreateConfig &config)
	{
		return detail::systemArena().createImpl<Engine, EngineImpl>(config);
	}

	const char *engineStateName(EngineStateEnum state)
	{
		switch (state)
		{
		case EngineStateEnum::Idle: return "idle";
		case EngineStateEnum::Loaded: return "loaded";
		case EngineStateEnum::Running: return "running";
		case EngineStateEnum::Halted: return "halted";
		case EngineStateEnum::Failed: return "failed";
		}
		return "unknown";
	}

	void Engine::loadProgram(PointerRange<const Instruction> program)
	{
		EngineImpl *impl = (EngineImpl *)this;
		impl->load(program);
	}

	void Engine::run()
	{
		EngineImpl *impl = (EngineImpl *)this;
		impl->run();
	}

	EngineStateEnum Engine::state() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->state;
	}

	uint32 Engine::getRegister(uint32 index) const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->get(index, "requested", "reading register");
	}

	DebugSnapshot Engine::snapshot() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		DebugSnapshot s;
		detail::memcpy(s.registers, impl->registers_, sizeof(s.registers));
		s.lastInstruction = impl->lastInstruction;
		s.instructionsExecuted = impl->stepIndex_;
		s.programCounter = impl->programCounter_;
		s.stackDepth = impl->sp;
		s.compareFlag = impl->compareFlag_;
		s.state = impl->state;
		return s;
	}

	PointerRange<const uint32> Engine::registers() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return PointerRange<const uint32>(impl->registers_, impl->registers_ + RegistersCount);
	}

	PointerRange<const uint32> Engine::stack() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->stack_;
	}

	PointerRange<const uint8> Engine::memory() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->memory_;
	}

	PointerRange<const Instruction> Engine::program() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->program_;
	}

	uint32 Engine::programCounter() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->programCounter_;
	}

	sint8 Engine::compareFlag() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->compareFlag_;
	}

	uint64 Engine::stepIndex() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->stepIndex_;
	}

	uint64 Engine::executionCount(uint32 pc) const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		if (pc >= impl->executionCounts.size())
			return 0;
		return impl->executionCounts[pc];
	}

	uint32 Engine::hotInstructionsCount() const
	{
		const EngineImpl *impl = (const EngineImpl *)this;
		return impl->hotCount;
	}
}
