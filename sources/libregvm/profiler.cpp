#include <cage-core/pointerRangeHolder.h>
#include <cage-core/timer.h>

#include <regvm/debug.h>

#include <algorithm>
#include <map>
#include <vector>

namespace regvm
{
	namespace
	{
		constexpr uint32 HotInstructionsReported = 10;

		void update(InstructionStats &st, uint64 elapsed)
		{
			st.executionCount++;
			st.totalTime += elapsed;
			if (elapsed < st.minTime)
				st.minTime = elapsed;
			if (elapsed > st.maxTime)
				st.maxTime = elapsed;
		}

		uint64 average(const InstructionStats &st)
		{
			if (st.executionCount == 0)
				return 0;
			return st.totalTime / st.executionCount;
		}
	}

	struct ProfilerImpl : public Profiler
	{
		const ProfilerCreateConfig config;
		std::map<uint32, InstructionStats> instructions; // by pc
		InstructionStats opcodes[OpcodesCount];
		std::map<uint32, uint64> reads, writes; // by address
		Holder<Timer> timer = newTimer();
		uint32 currentPc = 0;
		OpcodeEnum currentOpcode = OpcodeEnum::Halt;
		bool inside = false;

		ProfilerImpl(const ProfilerCreateConfig &config) : config(config)
		{}

		void begin(const Engine *engine)
		{
			currentPc = engine->programCounter();
			currentOpcode = engine->program()[currentPc].opcode;
			inside = true;
			timer->reset();
		}

		void end(const Engine *)
		{
			if (!inside)
				return;
			const uint64 elapsed = timer->duration();
			if (config.trackHotInstructions)
				update(instructions[currentPc], elapsed);
			if (config.trackOpcodeStats)
				update(opcodes[(uint32)currentOpcode], elapsed);
			inside = false;
		}

		void access(const MemoryAccess &a)
		{
			if (!config.trackMemoryPattern)
				return;
			if (a.write)
				writes[a.address]++;
			else
				reads[a.address]++;
		}

		Holder<PointerRange<string>> report() const
		{
			PointerRangeHolder<string> lines;
			lines.push_back("VM Profiler Report");
			lines.push_back("==================");

			if (config.trackHotInstructions)
			{
				std::vector<std::pair<uint32, InstructionStats>> hot(instructions.begin(), instructions.end());
				std::stable_sort(hot.begin(), hot.end(), [](const auto &a, const auto &b) { return a.second.executionCount > b.second.executionCount; });
				if (hot.size() > HotInstructionsReported)
					hot.resize(HotInstructionsReported);
				lines.push_back("Hot Instructions:");
				uint32 rank = 1;
				for (const auto &it : hot)
				{
					const InstructionStats &st = it.second;
					lines.push_back(stringizer() + rank++ + ". PC=" + it.first + " | Count=" + st.executionCount + " | Avg=" + average(st) + "us | Min=" + st.minTime + "us | Max=" + st.maxTime + "us");
				}
			}

			if (config.trackOpcodeStats)
			{
				std::vector<uint32> order;
				for (uint32 i = 0; i < OpcodesCount; i++)
					if (opcodes[i].executionCount > 0)
						order.push_back(i);
				std::stable_sort(order.begin(), order.end(), [&](uint32 a, uint32 b) { return opcodes[a].executionCount > opcodes[b].executionCount; });
				lines.push_back("Opcode Statistics:");
				for (uint32 i : order)
				{
					const InstructionStats &st = opcodes[i];
					lines.push_back(stringizer() + opcodeName((OpcodeEnum)i) + ": Count=" + st.executionCount + " | Total=" + st.totalTime + "us | Avg=" + average(st) + "us");
				}
			}

			if (config.trackMemoryPattern && (!reads.empty() || !writes.empty()))
			{
				std::map<uint32, std::pair<uint64, uint64>> merged;
				for (const auto &it : reads)
					merged[it.first].first = it.second;
				for (const auto &it : writes)
					merged[it.first].second = it.second;
				lines.push_back("Memory Accesses:");
				for (const auto &it : merged)
					lines.push_back(stringizer() + it.first + ": reads=" + it.second.first + ", writes=" + it.second.second);
			}

			return lines;
		}
	};

	void Profiler::beginInstruction(const Engine *engine)
	{
		ProfilerImpl *impl = (ProfilerImpl *)this;
		impl->begin(engine);
	}

	void Profiler::endInstruction(const Engine *engine)
	{
		ProfilerImpl *impl = (ProfilerImpl *)this;
		impl->end(engine);
	}

	void Profiler::recordMemoryAccess(const MemoryAccess &access)
	{
		ProfilerImpl *impl = (ProfilerImpl *)this;
		impl->access(access);
	}

	InstructionStats Profiler::instructionStats(uint32 pc) const
	{
		const ProfilerImpl *impl = (const ProfilerImpl *)this;
		const auto it = impl->instructions.find(pc);
		if (it == impl->instructions.end())
			return {};
		return it->second;
	}

	InstructionStats Profiler::opcodeStats(OpcodeEnum opcode) const
	{
		const ProfilerImpl *impl = (const ProfilerImpl *)this;
		CAGE_ASSERT((uint32)opcode < OpcodesCount);
		return impl->opcodes[(uint32)opcode];
	}

	uint64 Profiler::memoryReads(uint32 address) const
	{
		const ProfilerImpl *impl = (const ProfilerImpl *)this;
		const auto it = impl->reads.find(address);
		return it == impl->reads.end() ? 0 : it->second;
	}

	uint64 Profiler::memoryWrites(uint32 address) const
	{
		const ProfilerImpl *impl = (const ProfilerImpl *)this;
		const auto it = impl->writes.find(address);
		return it == impl->writes.end() ? 0 : it->second;
	}

	Holder<PointerRange<string>> Profiler::report() const
	{
		const ProfilerImpl *impl = (const ProfilerImpl *)this;
		return impl->report();
	}

	Holder<Profiler> newProfiler(const ProfilerCreateConfig &config)
	{
		return detail::systemArena().createImpl<Profiler, ProfilerImpl>(config);
	}
}
