#ifndef samples_h_w83jd0vn2c
#define samples_h_w83jd0vn2c

#include <regvm/regvm.h>

#include <vector>

using namespace regvm;

struct SampleParams
{
	uint32 a = 5;
	uint32 b = 10;
	uint32 n = 10;
};

// throws when the name is not one of: simple, calculator, counter, fib
std::vector<Instruction> buildSample(const string &name, const SampleParams &params);

#endif // samples_h_w83jd0vn2c
