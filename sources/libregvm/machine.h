#include <regvm/regvm.h>

#include <variant>
#include <vector>

namespace regvm
{
	namespace ops
	{
		struct Halt {};
		struct Load { uint32 dst; uint32 value; };
		struct Add { uint32 dst, lhs, rhs; };
		struct Sub { uint32 dst, lhs, rhs; };
		struct Mul { uint32 dst, lhs, rhs; };
		struct Div { uint32 dst, lhs, rhs; };
		struct Mod { uint32 dst, lhs, rhs; };
		struct Cmp { uint32 lhs, rhs; };
		struct Jmp { uint32 target; };
		struct Jeq { uint32 target; };
		struct Jne { uint32 target; };
		struct Jgt { uint32 target; };
		struct Jlt { uint32 target; };
		struct Jge { uint32 target; };
		struct Push { uint32 src; };
		struct Pop { uint32 dst; };
		struct Store { uint32 src; uint32 address; };
		struct LoadMem { uint32 dst; uint32 address; };
		struct Memcpy { uint32 dst, src, length; };
		struct Call { uint32 target; };
		struct Ret {};
	}

	// one alternative per opcode, each carrying only the operands it uses
	using Operation = std::variant<ops::Halt, ops::Load, ops::Add, ops::Sub, ops::Mul, ops::Div, ops::Mod, ops::Cmp,
		ops::Jmp, ops::Jeq, ops::Jne, ops::Jgt, ops::Jlt, ops::Jge, ops::Push, ops::Pop,
		ops::Store, ops::LoadMem, ops::Memcpy, ops::Call, ops::Ret>;

	Operation decode(const Instruction &inst);

	struct MachineState
	{
		uint32 registers_[RegistersCount] = {};
		std::vector<uint32> stack_;
		std::vector<uint8> memory_;
		PointerRange<const Instruction> program_;
		Delegate<void(const MemoryAccess &)> memoryAccess;
		uint32 stackCapacity = m;
		uint32 sp = 0; // equals stack_.size()
		uint32 programCounter_ = 0; // index of current instruction in the program
		sint8 compareFlag_ = 0;
		bool running = false;
		bool jumped = false; // the current instruction has set the program counter

		uint32 get(uint32 index, const char *operand, const char *operation) const;
		void set(uint32 index, uint32 value, const char *operand, const char *operation);
		void checkTarget(uint32 target, const char *operation) const;
		void checkMemoryRange(uint32 address, uint32 size, const char *operation) const;
		void recordMemoryAccess(uint32 address, uint32 value, bool write) const;
		void jump(uint32 target);
		void push(uint32 value, const char *operation);
		uint32 pop(const char *operation);
	};

	namespace instructions
	{
		void halt(MachineState &s);
		void load(MachineState &s, const ops::Load &op);
		void add(MachineState &s, const ops::Add &op);
		void sub(MachineState &s, const ops::Sub &op);
		void mul(MachineState &s, const ops::Mul &op);
		void div(MachineState &s, const ops::Div &op);
		void mod(MachineState &s, const ops::Mod &op);
		void cmp(MachineState &s, const ops::Cmp &op);
		void jmp(MachineState &s, const ops::Jmp &op);
		void jeq(MachineState &s, const ops::Jeq &op);
		void jne(MachineState &s, const ops::Jne &op);
		void jgt(MachineState &s, const ops::Jgt &op);
		void jlt(MachineState &s, const ops::Jlt &op);
		void jge(MachineState &s, const ops::Jge &op);
		void push(MachineState &s, const ops::Push &op);
		void pop(MachineState &s, const ops::Pop &op);
		void store(MachineState &s, const ops::Store &op);
		void loadMem(MachineState &s, const ops::LoadMem &op);
		void memcpy(MachineState &s, const ops::Memcpy &op);
		void call(MachineState &s, const ops::Call &op);
		void ret(MachineState &s);
	}

	void dispatch(MachineState &state, const Operation &operation);
}
