#include <cage-core/pointerRangeHolder.h>
#include <cage-core/math.h>

#include <regvm/debug.h>

namespace regvm
{
	namespace
	{
		constexpr uint32 StackItemsShown = 16;
		constexpr uint32 RegistersPerLine = 4;
		constexpr uint32 MemoryBytesPerLine = 16;

		const char *const ColorHeader = "\x1b[1;36m";
		const char *const ColorChanged = "\x1b[1;33m";
		const char *const ColorReset = "\x1b[0m";

		string hexByte(uint8 v)
		{
			constexpr const char digits[] = "0123456789abcdef";
			char buf[3] = { digits[v >> 4], digits[v & 15], 0 };
			return string(buf);
		}

		string header(const char *title, const VisualizerConfig &config)
		{
			if (config.colors)
				return stringizer() + ColorHeader + title + ColorReset;
			return title;
		}

		string compactLine(const Engine *engine)
		{
			const auto rs = engine->registers();
			string s = stringizer() + "PC=" + engine->programCounter() + " FLAG=" + (sint32)engine->compareFlag() + " SP=" + (uint64)engine->stack().size() + " |";
			for (uint32 i = 0; i < RegistersCount; i++)
				if (rs[i] != 0)
					s += stringizer() + " R" + i + "=" + rs[i];
			return s;
		}
	}

	Holder<PointerRange<string>> visualizeState(const Engine *engine, const VisualizerConfig &config)
	{
		CAGE_ASSERT(engine);
		PointerRangeHolder<string> lines;

		if (config.compact)
		{
			lines.push_back(compactLine(engine));
			return lines;
		}

		if (config.showRegisters)
		{
			lines.push_back(header("Registers:", config));
			const auto rs = engine->registers();
			for (uint32 i = 0; i < RegistersCount; i += RegistersPerLine)
			{
				string s;
				for (uint32 j = i; j < i + RegistersPerLine; j++)
				{
					string cell = stringizer() + "R" + j + "=" + rs[j];
					if (config.colors && rs[j] != 0)
						cell = stringizer() + ColorChanged + cell + ColorReset;
					s += cell + "\t";
				}
				lines.push_back(s);
			}
		}

		if (config.showStack)
		{
			const auto st = engine->stack();
			lines.push_back(header("Stack:", config));
			lines.push_back(stringizer() + "depth: " + (uint64)st.size());
			const uint32 count = min(numeric_cast<uint32>(st.size()), StackItemsShown);
			for (uint32 i = 0; i < count; i++)
			{
				const uint32 index = numeric_cast<uint32>(st.size()) - 1 - i;
				lines.push_back(stringizer() + "[" + index + "] " + st[index]);
			}
		}

		if (config.showMemory)
		{
			const auto mem = engine->memory();
			const uint32 start = min(config.memoryStart, numeric_cast<uint32>(mem.size()));
			const uint32 end = numeric_cast<uint32>(min((uint64)start + config.memoryLength, (uint64)mem.size()));
			lines.push_back(header("Memory:", config));
			for (uint32 row = start; row < end; row += MemoryBytesPerLine)
			{
				string s = stringizer() + row + ":";
				for (uint32 i = row; i < min(row + MemoryBytesPerLine, end); i++)
					s += stringizer() + " " + hexByte(mem[i]);
				lines.push_back(s);
			}
		}

		if (config.showExecutionStats)
		{
			lines.push_back(header("Execution:", config));
			lines.push_back(stringizer() + "state: " + engineStateName(engine->state()));
			lines.push_back(stringizer() + "pc: " + engine->programCounter());
			lines.push_back(stringizer() + "compare flag: " + (sint32)engine->compareFlag());
			lines.push_back(stringizer() + "instructions executed: " + engine->stepIndex());
			lines.push_back(stringizer() + "hot instructions: " + engine->hotInstructionsCount());
		}

		return lines;
	}
}
