#include <cage-core/logger.h>
#include <cage-core/ini.h>
#include <cage-core/config.h>
#include <cage-core/files.h>
#include <cage-core/memoryBuffer.h>
#include <cage-core/pointerRangeHolder.h>

#include <regvm/debug.h>

#include "samples.h"

namespace
{
	TraceLevelEnum traceLevelFromName(const string &name)
	{
		if (name == "none")
			return TraceLevelEnum::None;
		if (name == "minimal")
			return TraceLevelEnum::Minimal;
		if (name == "standard")
			return TraceLevelEnum::Standard;
		if (name == "verbose")
			return TraceLevelEnum::Verbose;
		if (name == "profile")
			return TraceLevelEnum::Profile;
		CAGE_THROW_ERROR(Exception, "unknown trace level");
	}

	void logState(const Engine *engine, bool compact)
	{
		VisualizerConfig cfg;
		cfg.compact = compact;
		cfg.showMemory = false;
		const auto lines = visualizeState(engine, cfg);
		for (const string &l : *lines)
			CAGE_LOG(SeverityEnum::Info, "regvmint", l);
	}
}

int main(int argc, const char *args[])
{
	try
	{
		Holder<Logger> logger = newLogger();
		logger->format.bind<logFormatConsole>();
		logger->output.bind<logOutputStdOut>();

		ConfigString programPath("regvmint/path/program");
		ConfigString sampleName("regvmint/sample/name", "simple");
		ConfigUint32 sampleA("regvmint/sample/a", 5);
		ConfigUint32 sampleB("regvmint/sample/b", 10);
		ConfigUint32 sampleN("regvmint/sample/n", 10);
		ConfigString limitsPath("regvmint/path/limits");
		ConfigString tracePath("regvmint/path/trace");
		ConfigString traceLevel("regvmint/trace/level", "standard");
		ConfigString profilePath("regvmint/path/profile");
		ConfigString dumpPath("regvmint/path/dump");
		ConfigBool compactState("regvmint/state/compact");
		ConfigBool debugMode("regvmint/debug");
		ConfigBool suppressConsoleLog("regvmint/log/suppressConsole");

		{
			Holder<Ini> ini = newIni();
			ini->parseCmd(argc, args);
			programPath = ini->cmdString('p', "program", programPath);
			sampleName = ini->cmdString('e', "example", sampleName);
			sampleA = ini->cmdUint32('a', "a", sampleA);
			sampleB = ini->cmdUint32('b', "b", sampleB);
			sampleN = ini->cmdUint32('n', "n", sampleN);
			limitsPath = ini->cmdString('l', "limits", limitsPath);
			tracePath = ini->cmdString('t', "trace", tracePath);
			traceLevel = ini->cmdString('v', "level", traceLevel);
			profilePath = ini->cmdString('r', "profile", profilePath);
			dumpPath = ini->cmdString('d', "dump", dumpPath);
			compactState = ini->cmdBool('c', "compact", compactState);
			debugMode = ini->cmdBool('g', "debug", debugMode);
			suppressConsoleLog = ini->cmdBool('f', "filter", suppressConsoleLog);
			ini->checkUnusedWithHelp();
		}

		if (suppressConsoleLog)
			logger.clear();

		Holder<PointerRange<Instruction>> program;
		if (!string(programPath).empty())
		{
			CAGE_LOG(SeverityEnum::Info, "regvmint", stringizer() + "loading program at path: '" + string(programPath) + "'");
			Holder<File> file = readFile(programPath);
			program = decodeProgram(file->readAll());
		}
		else
		{
			CAGE_LOG(SeverityEnum::Info, "regvmint", stringizer() + "building sample program: '" + string(sampleName) + "'");
			SampleParams params;
			params.a = sampleA;
			params.b = sampleB;
			params.n = sampleN;
			const std::vector<Instruction> sample = buildSample(string(sampleName), params);
			PointerRangeHolder<Instruction> instructions;
			instructions.insert(instructions.end(), sample.begin(), sample.end());
			program = std::move(instructions);
		}

		if (!string(dumpPath).empty())
		{
			CAGE_LOG(SeverityEnum::Info, "regvmint", stringizer() + "saving program encoding to: '" + string(dumpPath) + "'");
			const MemoryBuffer buffer = encodeProgram(*program);
			Holder<File> file = writeFile(dumpPath);
			file->write(buffer);
			file->close();
		}

		Holder<Debugger> debugger;
		if (!string(tracePath).empty() || !string(profilePath).empty())
		{
			DebuggerCreateConfig cfg;
			cfg.tracePath = string(tracePath);
			cfg.profilePath = string(profilePath);
			cfg.traceLevel = string(tracePath).empty() ? TraceLevelEnum::None : traceLevelFromName(string(traceLevel));
			cfg.profiling = !string(profilePath).empty();
			debugger = newDebugger(cfg);
		}

		Holder<Engine> engine;
		{
			EngineCreateConfig cfg;
			if (!string(limitsPath).empty())
			{
				CAGE_LOG(SeverityEnum::Info, "regvmint", stringizer() + "loading limits at path: '" + string(limitsPath) + "'");
				Holder<Ini> limits = newIni();
				limits->importFile(limitsPath);
				cfg.limits = regvm::limitsFromIni(+limits);
			}
			if (debugger)
				debugger->bind(cfg.hooks);
			cfg.debugMode = debugMode;
			engine = newEngine(cfg);
			engine->loadProgram(*program);
		}

		try
		{
			engine->run();
			CAGE_LOG(SeverityEnum::Note, "regvmint", stringizer() + "finished in " + engine->stepIndex() + " steps");
		}
		catch (const VmError &e)
		{
			const auto report = errorReport(e);
			for (const string &l : *report)
				CAGE_LOG(SeverityEnum::Note, "regvmint", l);
			logState(+engine, compactState);
			if (debugger)
				debugger->saveReports();
			throw;
		}

		logState(+engine, compactState);
		if (debugger)
			debugger->saveReports();

		return 0;
	}
	catch (...)
	{
		detail::logCurrentCaughtException();
	}
	return 1;
}
