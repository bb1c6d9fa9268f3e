#include "samples.h"

namespace
{
	Instruction inst(OpcodeEnum opcode, uint8 dest = 0, uint32 op1 = 0, uint32 op2 = 0)
	{
		Instruction i;
		i.opcode = opcode;
		i.destReg = dest;
		i.operand1 = op1;
		i.operand2 = op2;
		return i;
	}

	// R3 = a + b, R4 = b - a
	std::vector<Instruction> simple(const SampleParams &p)
	{
		return {
			inst(OpcodeEnum::Load, 1, p.a),
			inst(OpcodeEnum::Load, 2, p.b),
			inst(OpcodeEnum::Add, 3, 1, 2),
			inst(OpcodeEnum::Sub, 4, 2, 1),
			inst(OpcodeEnum::Halt),
		};
	}

	// R3 = a + b, R4 = a - b
	std::vector<Instruction> calculator(const SampleParams &p)
	{
		return {
			inst(OpcodeEnum::Load, 1, p.a),
			inst(OpcodeEnum::Load, 2, p.b),
			inst(OpcodeEnum::Add, 3, 1, 2),
			inst(OpcodeEnum::Sub, 4, 1, 2),
			inst(OpcodeEnum::Halt),
		};
	}

	// counts R1 up to n
	std::vector<Instruction> counter(const SampleParams &p)
	{
		return {
			inst(OpcodeEnum::Load, 1, 0),
			inst(OpcodeEnum::Load, 2, p.n),
			inst(OpcodeEnum::Load, 3, 1),
			inst(OpcodeEnum::Cmp, 0, 1, 2),
			inst(OpcodeEnum::Jge, 0, 7),
			inst(OpcodeEnum::Add, 1, 1, 3),
			inst(OpcodeEnum::Jmp, 0, 3),
			inst(OpcodeEnum::Halt),
		};
	}

	// iterative fibonacci of n, result in R3
	std::vector<Instruction> fib(const SampleParams &p)
	{
		constexpr uint8 N = 2, Current = 3, Counter = 1, Prev1 = 4, Prev2 = 5, Two = 6, One = 7, Limit = 8;
		constexpr uint32 Loop = 10, Small = 19, Done = 21;
		return {
			inst(OpcodeEnum::Load, N, p.n),
			inst(OpcodeEnum::Load, Two, 2),
			inst(OpcodeEnum::Cmp, 0, N, Two),
			inst(OpcodeEnum::Jlt, 0, Small),
			inst(OpcodeEnum::Load, Counter, 2),
			inst(OpcodeEnum::Load, Current, 0),
			inst(OpcodeEnum::Load, Prev1, 0),
			inst(OpcodeEnum::Load, Prev2, 1),
			inst(OpcodeEnum::Load, One, 1),
			inst(OpcodeEnum::Load, Limit, p.n + 1),
			inst(OpcodeEnum::Cmp, 0, Counter, Limit), // Loop
			inst(OpcodeEnum::Jgt, 0, Done),
			inst(OpcodeEnum::Add, Current, Prev1, Prev2),
			inst(OpcodeEnum::Push, Prev1),
			inst(OpcodeEnum::Pop, Prev2),
			inst(OpcodeEnum::Push, Current),
			inst(OpcodeEnum::Pop, Prev1),
			inst(OpcodeEnum::Add, Counter, Counter, One),
			inst(OpcodeEnum::Jmp, 0, Loop),
			inst(OpcodeEnum::Push, N), // Small
			inst(OpcodeEnum::Pop, Current),
			inst(OpcodeEnum::Halt), // Done
		};
	}
}

std::vector<Instruction> buildSample(const string &name, const SampleParams &params)
{
	if (name == "simple")
		return simple(params);
	if (name == "calculator")
		return calculator(params);
	if (name == "counter")
		return counter(params);
	if (name == "fib")
		return fib(params);
	CAGE_THROW_ERROR(Exception, "unknown sample program");
}
