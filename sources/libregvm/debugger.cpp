#include <cage-core/files.h>

#include <regvm/debug.h>

namespace regvm
{
	namespace
	{
		void saveLines(const string &path, const Holder<PointerRange<string>> &lines)
		{
			Holder<File> f = writeFile(path);
			for (const string &l : *lines)
				f->writeLine(l);
			f->close();
			CAGE_LOG(SeverityEnum::Info, "regvm", stringizer() + "saved report: '" + path + "'");
		}
	}

	struct DebuggerImpl : public Debugger
	{
		const DebuggerCreateConfig config;
		Holder<Tracer> tracer;
		Holder<Profiler> profiler;

		DebuggerImpl(const DebuggerCreateConfig &config) : config(config)
		{
			if (config.traceLevel != TraceLevelEnum::None)
				tracer = newTracer(config.traceLevel);
			if (config.profiling)
				profiler = newProfiler(config.profilerConfig);
		}
	};

	void Debugger::beginInstruction(const Engine *engine)
	{
		DebuggerImpl *impl = (DebuggerImpl *)this;
		if (impl->tracer)
			impl->tracer->beginInstruction(engine);
		if (impl->profiler)
			impl->profiler->beginInstruction(engine);
	}

	void Debugger::endInstruction(const Engine *engine)
	{
		DebuggerImpl *impl = (DebuggerImpl *)this;
		if (impl->tracer)
			impl->tracer->endInstruction(engine);
		if (impl->profiler)
			impl->profiler->endInstruction(engine);
	}

	void Debugger::recordMemoryAccess(const MemoryAccess &access)
	{
		DebuggerImpl *impl = (DebuggerImpl *)this;
		if (impl->tracer)
			impl->tracer->recordMemoryAccess(access);
		if (impl->profiler)
			impl->profiler->recordMemoryAccess(access);
	}

	void Debugger::bind(EngineHooks &hooks)
	{
		hooks.beginInstruction.bind<Debugger, &Debugger::beginInstruction>(this);
		hooks.endInstruction.bind<Debugger, &Debugger::endInstruction>(this);
		hooks.memoryAccess.bind<Debugger, &Debugger::recordMemoryAccess>(this);
	}

	Tracer *Debugger::tracer() const
	{
		const DebuggerImpl *impl = (const DebuggerImpl *)this;
		return +impl->tracer;
	}

	Profiler *Debugger::profiler() const
	{
		const DebuggerImpl *impl = (const DebuggerImpl *)this;
		return +impl->profiler;
	}

	void Debugger::saveReports() const
	{
		const DebuggerImpl *impl = (const DebuggerImpl *)this;
		if (impl->tracer && !impl->config.tracePath.empty())
			saveLines(impl->config.tracePath, impl->tracer->report());
		if (impl->profiler && !impl->config.profilePath.empty())
			saveLines(impl->config.profilePath, impl->profiler->report());
	}

	Holder<Debugger> newDebugger(const DebuggerCreateConfig &config)
	{
		return detail::systemArena().createImpl<Debugger, DebuggerImpl>(config);
	}
}
