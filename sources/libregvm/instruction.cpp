#include <cage-core/memoryBuffer.h>
#include <cage-core/pointerRangeHolder.h>
#include <cage-core/serialization.h>

#include "machine.h"

namespace regvm
{
	namespace
	{
		void checkOpcode(uint32 opcode)
		{
			if (opcode >= OpcodesCount)
			{
				CAGE_THROW_ERROR(VmError, "invalid opcode", ErrorKindEnum::InvalidInstruction,
					ErrorContext{ "decoding instruction", stringizer() + "opcode " + opcode + " is not part of the instruction set", "use opcodes 0 through 20" });
			}
		}
	}

	const char *opcodeName(OpcodeEnum opcode)
	{
		switch (opcode)
		{
		case OpcodeEnum::Halt: return "HALT";
		case OpcodeEnum::Load: return "LOAD";
		case OpcodeEnum::Add: return "ADD";
		case OpcodeEnum::Sub: return "SUB";
		case OpcodeEnum::Mul: return "MUL";
		case OpcodeEnum::Div: return "DIV";
		case OpcodeEnum::Mod: return "MOD";
		case OpcodeEnum::Cmp: return "CMP";
		case OpcodeEnum::Jmp: return "JMP";
		case OpcodeEnum::Jeq: return "JEQ";
		case OpcodeEnum::Jne: return "JNE";
		case OpcodeEnum::Jgt: return "JGT";
		case OpcodeEnum::Jlt: return "JLT";
		case OpcodeEnum::Jge: return "JGE";
		case OpcodeEnum::Push: return "PUSH";
		case OpcodeEnum::Pop: return "POP";
		case OpcodeEnum::Store: return "STORE";
		case OpcodeEnum::LoadMem: return "LOAD_MEM";
		case OpcodeEnum::Memcpy: return "MEMCPY";
		case OpcodeEnum::Call: return "CALL";
		case OpcodeEnum::Ret: return "RET";
		}
		return "UNKNOWN";
	}

	bool operator == (const Instruction &l, const Instruction &r)
	{
		return l.opcode == r.opcode && l.destReg == r.destReg && l.operand1 == r.operand1 && l.operand2 == r.operand2;
	}

	bool operator != (const Instruction &l, const Instruction &r)
	{
		return !(l == r);
	}

	string instructionToString(const Instruction &inst)
	{
		return stringizer() + opcodeName(inst.opcode) + " dest_reg=" + (uint32)inst.destReg + ", op1=" + inst.operand1 + ", op2=" + inst.operand2;
	}

	MemoryBuffer encodeProgram(PointerRange<const Instruction> program)
	{
		MemoryBuffer buffer;
		Serializer ser(buffer);
		for (const Instruction &inst : program)
			ser << (uint8)inst.opcode << inst.destReg << inst.operand1 << inst.operand2;
		return buffer;
	}

	Holder<PointerRange<Instruction>> decodeProgram(PointerRange<const char> buffer)
	{
		if (buffer.size() % InstructionEncodedSize != 0)
		{
			CAGE_THROW_ERROR(VmError, "truncated program", ErrorKindEnum::InvalidInstruction,
				ErrorContext{ "decoding program", stringizer() + "buffer size " + (uint64)buffer.size() + " is not a multiple of " + InstructionEncodedSize, "provide whole 10-byte instruction records" });
		}
		PointerRangeHolder<Instruction> program;
		program.reserve(buffer.size() / InstructionEncodedSize);
		Deserializer des(buffer);
		while (des.available() > 0)
		{
			uint8 opcode;
			Instruction inst;
			des >> opcode >> inst.destReg >> inst.operand1 >> inst.operand2;
			checkOpcode(opcode);
			inst.opcode = (OpcodeEnum)opcode;
			program.push_back(inst);
		}
		return program;
	}

	Operation decode(const Instruction &inst)
	{
		const uint32 d = inst.destReg, a = inst.operand1, b = inst.operand2;
		switch (inst.opcode)
		{
		case OpcodeEnum::Halt: return ops::Halt{};
		case OpcodeEnum::Load: return ops::Load{ d, a };
		case OpcodeEnum::Add: return ops::Add{ d, a, b };
		case OpcodeEnum::Sub: return ops::Sub{ d, a, b };
		case OpcodeEnum::Mul: return ops::Mul{ d, a, b };
		case OpcodeEnum::Div: return ops::Div{ d, a, b };
		case OpcodeEnum::Mod: return ops::Mod{ d, a, b };
		case OpcodeEnum::Cmp: return ops::Cmp{ a, b };
		case OpcodeEnum::Jmp: return ops::Jmp{ a };
		case OpcodeEnum::Jeq: return ops::Jeq{ a };
		case OpcodeEnum::Jne: return ops::Jne{ a };
		case OpcodeEnum::Jgt: return ops::Jgt{ a };
		case OpcodeEnum::Jlt: return ops::Jlt{ a };
		case OpcodeEnum::Jge: return ops::Jge{ a };
		case OpcodeEnum::Push: return ops::Push{ d };
		case OpcodeEnum::Pop: return ops::Pop{ d };
		case OpcodeEnum::Store: return ops::Store{ d, a };
		case OpcodeEnum::LoadMem: return ops::LoadMem{ d, a };
		case OpcodeEnum::Memcpy: return ops::Memcpy{ d, a, b };
		case OpcodeEnum::Call: return ops::Call{ a };
		case OpcodeEnum::Ret: return ops::Ret{};
		}
		checkOpcode((uint32)inst.opcode); // only reachable through an unchecked cast
		return ops::Halt{};
	}
}
