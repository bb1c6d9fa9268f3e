#include <cage-core/pointerRangeHolder.h>
#include <cage-core/timer.h>

#include <regvm/debug.h>

#include <vector>

namespace regvm
{
	namespace
	{
		struct TraceEntry
		{
			std::vector<MemoryAccess> memoryAccesses;
			Instruction instruction;
			uint32 registersBefore[RegistersCount] = {};
			uint32 registersAfter[RegistersCount] = {};
			uint64 elapsed = 0;
			uint32 pc = 0;
			uint32 stackDepth = 0;
			sint8 compareFlag = 0;
		};

		void copyRegisters(uint32 (&target)[RegistersCount], const Engine *engine)
		{
			const auto rs = engine->registers();
			detail::memcpy(target, rs.data(), sizeof(target));
		}

		string registersLine(const char *prefix, const uint32 (&regs)[RegistersCount])
		{
			string s = prefix;
			for (uint32 i = 0; i < RegistersCount; i++)
				if (regs[i] != 0)
					s += stringizer() + "R" + i + "=" + regs[i] + " ";
			return s;
		}
	}

	struct TracerImpl : public Tracer
	{
		std::vector<TraceEntry> entries;
		TraceEntry current;
		Holder<Timer> timer = newTimer();
		const TraceLevelEnum level;
		bool inside = false;

		TracerImpl(TraceLevelEnum level) : level(level)
		{}

		bool detailed() const
		{
			return level == TraceLevelEnum::Standard || level == TraceLevelEnum::Verbose || level == TraceLevelEnum::Profile;
		}

		void begin(const Engine *engine)
		{
			if (level == TraceLevelEnum::None)
				return;
			current = TraceEntry();
			current.pc = engine->programCounter();
			current.instruction = engine->program()[current.pc];
			if (detailed())
			{
				copyRegisters(current.registersBefore, engine);
				current.stackDepth = numeric_cast<uint32>(engine->stack().size());
				current.compareFlag = engine->compareFlag();
			}
			inside = true;
			timer->reset();
		}

		void end(const Engine *engine)
		{
			if (!inside)
				return;
			if (level == TraceLevelEnum::Profile)
				current.elapsed = timer->duration();
			if (detailed())
				copyRegisters(current.registersAfter, engine);
			entries.push_back(std::move(current));
			inside = false;
		}

		void access(const MemoryAccess &a)
		{
			if (inside && level == TraceLevelEnum::Verbose)
				current.memoryAccesses.push_back(a);
		}

		Holder<PointerRange<string>> report() const
		{
			PointerRangeHolder<string> lines;
			lines.push_back(stringizer() + "Execution Trace (" + (uint64)entries.size() + " instructions)");
			lines.push_back("----------------------------------------");
			uint32 index = 0;
			for (const TraceEntry &e : entries)
			{
				lines.push_back(stringizer() + index++ + ": [PC=" + e.pc + "] " + instructionToString(e.instruction));
				if (detailed())
				{
					lines.push_back(registersLine("  Regs before: ", e.registersBefore));
					lines.push_back(registersLine("  Regs after:  ", e.registersAfter));
					lines.push_back(stringizer() + "  Stack depth: " + e.stackDepth);
					lines.push_back(stringizer() + "  Compare flag: " + (sint32)e.compareFlag);
				}
				if (level == TraceLevelEnum::Profile)
					lines.push_back(stringizer() + "  Exec time: " + e.elapsed + "us");
				if (!e.memoryAccesses.empty())
				{
					lines.push_back("  Memory accesses:");
					for (const MemoryAccess &a : e.memoryAccesses)
						lines.push_back(stringizer() + "    " + (a.write ? "WRITE" : "READ") + " addr=" + a.address + " size=" + (uint32)a.size + " value=" + a.value);
				}
			}
			return lines;
		}
	};

	void Tracer::beginInstruction(const Engine *engine)
	{
		TracerImpl *impl = (TracerImpl *)this;
		impl->begin(engine);
	}

	void Tracer::endInstruction(const Engine *engine)
	{
		TracerImpl *impl = (TracerImpl *)this;
		impl->end(engine);
	}

	void Tracer::recordMemoryAccess(const MemoryAccess &access)
	{
		TracerImpl *impl = (TracerImpl *)this;
		impl->access(access);
	}

	TraceLevelEnum Tracer::level() const
	{
		const TracerImpl *impl = (const TracerImpl *)this;
		return impl->level;
	}

	uint32 Tracer::entriesCount() const
	{
		const TracerImpl *impl = (const TracerImpl *)this;
		return numeric_cast<uint32>(impl->entries.size());
	}

	void Tracer::clear()
	{
		TracerImpl *impl = (TracerImpl *)this;
		impl->entries.clear();
		impl->inside = false;
	}

	Holder<PointerRange<string>> Tracer::report() const
	{
		const TracerImpl *impl = (const TracerImpl *)this;
		return impl->report();
	}

	Holder<Tracer> newTracer(TraceLevelEnum level)
	{
		return detail::systemArena().createImpl<Tracer, TracerImpl>(level);
	}
}
