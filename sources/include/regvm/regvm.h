#ifndef regvm_h_k4f8d2ws9q
#define regvm_h_k4f8d2ws9q

#include "cage-core/core.h"

#include <optional>

namespace regvm
{
	using namespace cage;

	constexpr uint32 RegistersCount = 16;
	constexpr uint32 InstructionEncodedSize = 10; // opcode, destReg, operand1, operand2

	enum class ErrorKindEnum : uint8
	{
		OutOfMemory,
		MemoryAccessViolation,
		StackOverflow,
		StackUnderflow,
		InvalidInstruction,
		UnsupportedOperation,
		DivisionByZero,
		TypeMismatch,
		ResourceExhausted,
		InvalidConfiguration,
		InvalidFunctionCall,
		InvalidMemoryAccess,
		InvalidAlignment,
		SecurityViolation,
		IntegerOverflow,
		IntegerUnderflow,
	};

	const char *errorKindName(ErrorKindEnum kind);

	struct SourceLocation
	{
		uint32 line = 0; // 1-based; the instruction index + 1 for runtime failures
		uint32 column = 0;
		const char *file = nullptr;
	};

	struct ErrorContext
	{
		const char *operation = nullptr; // what the vm was doing
		string details; // what exactly went wrong
		const char *suggestion = nullptr; // how to avoid it
		std::optional<SourceLocation> location;
	};

	struct VmError : public Exception
	{
		explicit VmError(StringLiteral file, uint32 line, StringLiteral function, SeverityEnum severity, StringLiteral message, ErrorKindEnum kind, const ErrorContext &context) noexcept;
		void log() override;

		ErrorContext context;
		ErrorKindEnum kind = ErrorKindEnum::InvalidInstruction;
	};

	Holder<PointerRange<string>> errorReport(const VmError &error);

	enum class OpcodeEnum : uint8
	{
		Halt = 0,    //
		Load,        // R uint32
		Add,         // R R R
		Sub,         // R R R
		Mul,         // R R R
		Div,         // R R R
		Mod,         // R R R
		Cmp,         // - R R
		Jmp,         // - uint32
		Jeq,         // - uint32
		Jne,         // - uint32
		Jgt,         // - uint32
		Jlt,         // - uint32
		Jge,         // - uint32
		Push,        // R
		Pop,         // R
		Store,       // R uint32
		LoadMem,     // R uint32
		Memcpy,      // uint8 uint32 uint32
		Call,        // - uint32
		Ret,         //
	};

	constexpr uint32 OpcodesCount = (uint32)OpcodeEnum::Ret + 1;

	const char *opcodeName(OpcodeEnum opcode);

	struct Instruction
	{
		OpcodeEnum opcode = OpcodeEnum::Halt;
		uint8 destReg = 0;
		uint32 operand1 = 0;
		uint32 operand2 = 0;
	};

	bool operator == (const Instruction &l, const Instruction &r);
	bool operator != (const Instruction &l, const Instruction &r);
	string instructionToString(const Instruction &inst);

	MemoryBuffer encodeProgram(PointerRange<const Instruction> program);
	Holder<PointerRange<Instruction>> decodeProgram(PointerRange<const char> buffer);

	enum class EngineStateEnum
	{
		Idle,
		Loaded,
		Running,
		Halted,
		Failed,
	};

	const char *engineStateName(EngineStateEnum state);

	struct MemoryAccess
	{
		uint32 address = 0;
		uint32 value = 0;
		uint8 size = 0;
		bool write = false;
	};

	struct DebugSnapshot
	{
		uint32 registers[RegistersCount] = {};
		std::optional<Instruction> lastInstruction;
		uint64 instructionsExecuted = 0;
		uint32 programCounter = 0;
		uint32 stackDepth = 0;
		sint8 compareFlag = 0;
		EngineStateEnum state = EngineStateEnum::Idle;
	};

	struct Engine : private Immovable
	{
		void loadProgram(PointerRange<const Instruction> program); // the program must outlive the run
		void run();

		EngineStateEnum state() const;
		uint32 getRegister(uint32 index) const;
		DebugSnapshot snapshot() const;

		PointerRange<const uint32> registers() const;
		PointerRange<const uint32> stack() const;
		PointerRange<const uint8> memory() const;
		PointerRange<const Instruction> program() const;
		uint32 programCounter() const;
		sint8 compareFlag() const;
		uint64 stepIndex() const; // instructions executed since the last loadProgram
		uint64 executionCount(uint32 pc) const;
		uint32 hotInstructionsCount() const;
	};

	struct EngineLimitsConfig
	{
		uint32 memorySize = 64 * 1024;
		uint32 stackCapacity = 1000000;
		uint64 maxSteps = m; // the run fails with ResourceExhausted after this many instructions
	};

	EngineLimitsConfig limitsFromIni(Ini *ini, const EngineLimitsConfig &defaults = {});
	void limitsToIni(const EngineLimitsConfig &limits, Ini *ini);

	struct EngineHooks
	{
		Delegate<void(const Engine *)> beginInstruction;
		Delegate<void(const Engine *)> endInstruction;
		Delegate<void(const MemoryAccess &)> memoryAccess;
	};

	struct EngineCreateConfig
	{
		EngineLimitsConfig limits;
		EngineHooks hooks;
		bool debugMode = false; // log every instruction
	};

	Holder<Engine> newEngine(const EngineCreateConfig &config);
}

#endif // regvm_h_k4f8d2ws9q
