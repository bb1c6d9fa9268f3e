#include <cage-core/ini.h>

#include "main.h"

void testConfiguration()
{
	CAGE_TESTCASE("configuration");

	{
		CAGE_TESTCASE("defaults");
		const EngineLimitsConfig limits;
		CAGE_TEST(limits.memorySize == 65536);
		CAGE_TEST(limits.stackCapacity == 1000000);
		CAGE_TEST(limits.maxSteps == m);
	}

	{
		CAGE_TESTCASE("empty ini keeps defaults");
		Holder<Ini> ini = newIni();
		EngineLimitsConfig defaults;
		defaults.memorySize = 1024;
		const EngineLimitsConfig limits = limitsFromIni(+ini, defaults);
		CAGE_TEST(limits.memorySize == 1024);
		CAGE_TEST(limits.stackCapacity == 1000000);
		CAGE_TEST(limits.maxSteps == m);
	}

	{
		CAGE_TESTCASE("ini values");
		Holder<Ini> ini = newIni();
		ini->setUint32("memory", "size", 256);
		ini->setUint32("stack", "capacity", 4);
		ini->setUint64("execution", "max_steps", 100);
		const EngineLimitsConfig limits = limitsFromIni(+ini);
		CAGE_TEST(limits.memorySize == 256);
		CAGE_TEST(limits.stackCapacity == 4);
		CAGE_TEST(limits.maxSteps == 100);

		EngineCreateConfig cfg;
		cfg.limits = limits;
		Holder<Engine> engine = newEngine(cfg);
		CAGE_TEST(engine->memory().size() == 256);
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Push, 0),
			inst(OpcodeEnum::Jmp, 0, 0),
		};
		engine->loadProgram(program);
		CAGE_TEST_THROWN_KIND(engine->run(), ErrorKindEnum::StackOverflow);
		CAGE_TEST(engine->stack().size() == 4);
	}

	{
		CAGE_TESTCASE("write and read back");
		EngineLimitsConfig limits;
		limits.memorySize = 4096;
		limits.stackCapacity = 64;
		limits.maxSteps = 123456789012;
		Holder<Ini> ini = newIni();
		limitsToIni(limits, +ini);
		CAGE_TEST(ini->getUint32("memory", "size") == 4096);
		CAGE_TEST(ini->getUint32("stack", "capacity") == 64);
		const EngineLimitsConfig back = limitsFromIni(+ini);
		CAGE_TEST(back.memorySize == 4096);
		CAGE_TEST(back.stackCapacity == 64);
		CAGE_TEST(back.maxSteps == 123456789012);
	}
}
