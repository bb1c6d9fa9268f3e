#include <cage-core/ini.h>

#include "regvm/regvm.h"

namespace regvm
{
	EngineLimitsConfig limitsFromIni(Ini *ini, const EngineLimitsConfig &defaults)
	{
		EngineLimitsConfig limits = defaults;
		limits.memorySize = ini->getUint32("memory", "size", limits.memorySize);
		limits.stackCapacity = ini->getUint32("stack", "capacity", limits.stackCapacity);
		limits.maxSteps = ini->getUint64("execution", "max_steps", limits.maxSteps);
		return limits;
	}

	void limitsToIni(const EngineLimitsConfig &limits, Ini *ini)
	{
		ini->setUint32("memory", "size", limits.memorySize);
		ini->setUint32("stack", "capacity", limits.stackCapacity);
		ini->setUint64("execution", "max_steps", limits.maxSteps);
	}
}
