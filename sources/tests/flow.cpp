#include "main.h"

namespace
{
	// runs CMP on the two values followed by the given conditional jump
	bool jumpTaken(uint32 a, uint32 b, OpcodeEnum jump)
	{
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 1, a),
			inst(OpcodeEnum::Load, 2, b),
			inst(OpcodeEnum::Cmp, 0, 1, 2),
			inst(jump, 0, 6),
			inst(OpcodeEnum::Load, 5, 1),
			inst(OpcodeEnum::Halt),
			inst(OpcodeEnum::Load, 5, 2),
			inst(OpcodeEnum::Halt),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		engine->run();
		CAGE_TEST(engine->state() == EngineStateEnum::Halted);
		return engine->getRegister(5) == 2;
	}

	sint8 compare(uint32 a, uint32 b)
	{
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 1, a),
			inst(OpcodeEnum::Load, 2, b),
			inst(OpcodeEnum::Cmp, 0, 1, 2),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		engine->run();
		return engine->compareFlag();
	}
}

void testFlow()
{
	CAGE_TESTCASE("flow");

	{
		CAGE_TESTCASE("compare flag");
		CAGE_TEST(compare(5, 5) == 0);
		CAGE_TEST(compare(7, 5) == 1);
		CAGE_TEST(compare(5, 7) == -1);
		CAGE_TEST(compare(0, 0xFFFFFFFF) == -1); // unsigned comparison
	}

	{
		CAGE_TESTCASE("conditional jumps");
		CAGE_TEST(jumpTaken(5, 5, OpcodeEnum::Jeq));
		CAGE_TEST(!jumpTaken(5, 6, OpcodeEnum::Jeq));
		CAGE_TEST(jumpTaken(5, 6, OpcodeEnum::Jne));
		CAGE_TEST(!jumpTaken(5, 5, OpcodeEnum::Jne));
		CAGE_TEST(jumpTaken(6, 5, OpcodeEnum::Jgt));
		CAGE_TEST(!jumpTaken(5, 5, OpcodeEnum::Jgt));
		CAGE_TEST(jumpTaken(4, 5, OpcodeEnum::Jlt));
		CAGE_TEST(!jumpTaken(5, 5, OpcodeEnum::Jlt));
		CAGE_TEST(jumpTaken(5, 5, OpcodeEnum::Jge));
		CAGE_TEST(jumpTaken(6, 5, OpcodeEnum::Jge));
		CAGE_TEST(!jumpTaken(4, 5, OpcodeEnum::Jge));
	}

	{
		CAGE_TESTCASE("unconditional jump");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 1, 1),
			inst(OpcodeEnum::Jmp, 0, 3),
			inst(OpcodeEnum::Load, 2, 2),
			inst(OpcodeEnum::Load, 3, 3),
			inst(OpcodeEnum::Halt),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		engine->run();
		const auto rs = engine->registers();
		CAGE_TEST(rs[1] == 1);
		CAGE_TEST(rs[2] == 0);
		CAGE_TEST(rs[3] == 3);
		CAGE_TEST(engine->stepIndex() == 4);
		CAGE_TEST(engine->executionCount(2) == 0);
	}

	{
		CAGE_TESTCASE("jump to the first instruction");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Add, 1, 1, 2),
			inst(OpcodeEnum::Cmp, 0, 1, 3),
			inst(OpcodeEnum::Jlt, 0, 0),
			inst(OpcodeEnum::Halt),
		};
		const std::vector<Instruction> setup = {
			inst(OpcodeEnum::Load, 2, 1),
			inst(OpcodeEnum::Load, 3, 10),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(setup);
		engine->run();
		engine->loadProgram(program);
		engine->run();
		CAGE_TEST(engine->getRegister(1) == 10);
		CAGE_TEST(engine->executionCount(0) == 10);
		CAGE_TEST(engine->executionCount(3) == 1);
	}

	{
		CAGE_TESTCASE("counting loop");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 1, 0),
			inst(OpcodeEnum::Load, 2, 10),
			inst(OpcodeEnum::Load, 3, 1),
			inst(OpcodeEnum::Cmp, 0, 1, 2),
			inst(OpcodeEnum::Jge, 0, 7),
			inst(OpcodeEnum::Add, 1, 1, 3),
			inst(OpcodeEnum::Jmp, 0, 3),
			inst(OpcodeEnum::Halt),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		engine->run();
		CAGE_TEST(engine->getRegister(1) == 10);
		CAGE_TEST(engine->executionCount(5) == 10);
		CAGE_TEST(engine->executionCount(3) == 11);
		CAGE_TEST(engine->programCounter() == 7);
	}

	{
		CAGE_TESTCASE("jump target out of range");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 1, 1),
			inst(OpcodeEnum::Jmp, 0, 2),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		CAGE_TEST_THROWN_KIND(engine->run(), ErrorKindEnum::InvalidInstruction);
		CAGE_TEST(engine->programCounter() == 1);
	}

	{
		CAGE_TESTCASE("conditional jump target is validated even when not taken");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 1, 1),
			inst(OpcodeEnum::Cmp, 0, 1, 0),
			inst(OpcodeEnum::Jeq, 0, 100),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		CAGE_TEST_THROWN_KIND(engine->run(), ErrorKindEnum::InvalidInstruction);
	}

	{
		CAGE_TESTCASE("call and return");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Call, 0, 3),
			inst(OpcodeEnum::Load, 2, 7),
			inst(OpcodeEnum::Halt),
			inst(OpcodeEnum::Load, 1, 5),
			inst(OpcodeEnum::Ret),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		engine->run();
		CAGE_TEST(engine->state() == EngineStateEnum::Halted);
		CAGE_TEST(engine->getRegister(1) == 5);
		CAGE_TEST(engine->getRegister(2) == 7);
		CAGE_TEST(engine->stack().empty());
		CAGE_TEST(engine->programCounter() == 2);
		CAGE_TEST(engine->stepIndex() == 5);
	}

	{
		CAGE_TESTCASE("nested calls");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 3, 1),
			inst(OpcodeEnum::Call, 0, 3),
			inst(OpcodeEnum::Halt),
			inst(OpcodeEnum::Add, 1, 1, 3), // outer
			inst(OpcodeEnum::Call, 0, 6),
			inst(OpcodeEnum::Ret),
			inst(OpcodeEnum::Add, 2, 2, 3), // inner
			inst(OpcodeEnum::Ret),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		engine->run();
		CAGE_TEST(engine->getRegister(1) == 1);
		CAGE_TEST(engine->getRegister(2) == 1);
		CAGE_TEST(engine->stack().empty());
		CAGE_TEST(engine->programCounter() == 2);
	}

	{
		CAGE_TESTCASE("call target out of range");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Call, 0, 5),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		CAGE_TEST_THROWN_KIND(engine->run(), ErrorKindEnum::InvalidInstruction);
		CAGE_TEST(engine->stack().empty());
	}

	{
		CAGE_TESTCASE("return with empty stack");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Ret),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		CAGE_TEST_THROWN_KIND(engine->run(), ErrorKindEnum::InvalidInstruction);
	}

	{
		CAGE_TESTCASE("return to an invalid address");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 1, 1000),
			inst(OpcodeEnum::Push, 1),
			inst(OpcodeEnum::Ret),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		CAGE_TEST_THROWN_KIND(engine->run(), ErrorKindEnum::InvalidInstruction);
		CAGE_TEST(engine->stack().size() == 1);
	}

	{
		CAGE_TESTCASE("return past the last instruction ends the run");
		const std::vector<Instruction> program = {
			inst(OpcodeEnum::Load, 1, 3),
			inst(OpcodeEnum::Push, 1),
			inst(OpcodeEnum::Ret),
		};
		Holder<Engine> engine = newEngine({});
		engine->loadProgram(program);
		engine->run();
		CAGE_TEST(engine->state() == EngineStateEnum::Halted);
		CAGE_TEST(engine->programCounter() == 3);
	}
}
