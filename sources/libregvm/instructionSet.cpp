#include "machine.h"

namespace regvm
{
	uint32 MachineState::get(uint32 index, const char *operand, const char *operation) const
	{
		if (index >= RegistersCount)
		{
			CAGE_THROW_ERROR(VmError, "register index out of range", ErrorKindEnum::InvalidInstruction,
				ErrorContext{ operation, stringizer() + operand + " register R" + index + " does not exist", "use registers 0 through 15" });
		}
		return registers_[index];
	}

	void MachineState::set(uint32 index, uint32 value, const char *operand, const char *operation)
	{
		if (index >= RegistersCount)
		{
			CAGE_THROW_ERROR(VmError, "register index out of range", ErrorKindEnum::InvalidInstruction,
				ErrorContext{ operation, stringizer() + operand + " register R" + index + " does not exist", "use registers 0 through 15" });
		}
		registers_[index] = value;
	}

	void MachineState::checkTarget(uint32 target, const char *operation) const
	{
		if (target >= program_.size())
		{
			CAGE_THROW_ERROR(VmError, "jump target out of range", ErrorKindEnum::InvalidInstruction,
				ErrorContext{ operation, stringizer() + "target " + target + " is outside of the program of " + (uint64)program_.size() + " instructions", "ensure the target is within the program" });
		}
	}

	void MachineState::checkMemoryRange(uint32 address, uint32 size, const char *operation) const
	{
		// 64-bit sum cannot wrap
		if ((uint64)address + size > memory_.size())
		{
			CAGE_THROW_ERROR(VmError, "memory address out of bounds", ErrorKindEnum::MemoryAccessViolation,
				ErrorContext{ operation, stringizer() + "range " + address + " + " + size + " exceeds memory size " + (uint64)memory_.size(), "access only addresses inside of the configured memory" });
		}
	}

	void MachineState::recordMemoryAccess(uint32 address, uint32 value, bool write) const
	{
		if (!memoryAccess)
			return;
		MemoryAccess a;
		a.address = address;
		a.value = value;
		a.size = sizeof(uint32);
		a.write = write;
		memoryAccess(a);
	}

	void MachineState::jump(uint32 target)
	{
		programCounter_ = target;
		jumped = true;
	}

	void MachineState::push(uint32 value, const char *operation)
	{
		if (stack_.size() >= stackCapacity)
		{
			CAGE_THROW_ERROR(VmError, "stack is full", ErrorKindEnum::StackOverflow,
				ErrorContext{ operation, stringizer() + "stack reached its capacity of " + stackCapacity + " values", "check for runaway recursion or increase the stack capacity" });
		}
		stack_.push_back(value);
		sp++;
		CAGE_ASSERT(sp == stack_.size());
	}

	uint32 MachineState::pop(const char *operation)
	{
		if (stack_.empty())
		{
			CAGE_THROW_ERROR(VmError, "stack is empty", ErrorKindEnum::InvalidInstruction,
				ErrorContext{ operation, "stack is empty", "ensure the stack has values before popping" });
		}
		const uint32 v = stack_.back();
		stack_.pop_back();
		sp--;
		CAGE_ASSERT(sp == stack_.size());
		return v;
	}

	namespace instructions
	{
		void halt(MachineState &s)
		{
			s.running = false;
		}

		void load(MachineState &s, const ops::Load &op)
		{
			s.set(op.dst, op.value, "destination", "executing LOAD");
		}

		void add(MachineState &s, const ops::Add &op)
		{
			const char *const operation = "executing ADD";
			const uint32 l = s.get(op.lhs, "first source", operation);
			const uint32 r = s.get(op.rhs, "second source", operation);
			const uint64 v = (uint64)l + r;
			if (v > (uint32)m)
			{
				s.set(op.dst, m, "destination", operation);
				CAGE_THROW_ERROR(VmError, "integer overflow", ErrorKindEnum::IntegerOverflow,
					ErrorContext{ operation, stringizer() + l + " + " + r + " does not fit into 32 bits", "keep operands small enough or check them before adding" });
			}
			s.set(op.dst, (uint32)v, "destination", operation);
		}

		void sub(MachineState &s, const ops::Sub &op)
		{
			const char *const operation = "executing SUB";
			const uint32 l = s.get(op.lhs, "first source", operation);
			const uint32 r = s.get(op.rhs, "second source", operation);
			if (l < r)
			{
				s.set(op.dst, 0, "destination", operation);
				CAGE_THROW_ERROR(VmError, "integer underflow", ErrorKindEnum::IntegerUnderflow,
					ErrorContext{ operation, stringizer() + l + " - " + r + " is negative", "compare the operands before subtracting" });
			}
			s.set(op.dst, l - r, "destination", operation);
		}

		void mul(MachineState &s, const ops::Mul &op)
		{
			const char *const operation = "executing MUL";
			const uint32 l = s.get(op.lhs, "first source", operation);
			const uint32 r = s.get(op.rhs, "second source", operation);
			const uint64 v = (uint64)l * r;
			if (v > (uint32)m)
			{
				s.set(op.dst, m, "destination", operation);
				CAGE_THROW_ERROR(VmError, "integer overflow", ErrorKindEnum::IntegerOverflow,
					ErrorContext{ operation, stringizer() + l + " * " + r + " does not fit into 32 bits", "keep operands small enough or check them before multiplying" });
			}
			s.set(op.dst, (uint32)v, "destination", operation);
		}

		void div(MachineState &s, const ops::Div &op)
		{
			const char *const operation = "executing DIV";
			s.get(op.dst, "destination", operation);
			const uint32 l = s.get(op.lhs, "first source", operation);
			const uint32 r = s.get(op.rhs, "second source", operation);
			if (r == 0)
			{
				CAGE_THROW_ERROR(VmError, "division by zero", ErrorKindEnum::DivisionByZero,
					ErrorContext{ operation, "attempted to divide by zero", "ensure the divisor is not zero" });
			}
			s.set(op.dst, l / r, "destination", operation);
		}

		void mod(MachineState &s, const ops::Mod &op)
		{
			const char *const operation = "executing MOD";
			s.get(op.dst, "destination", operation);
			const uint32 l = s.get(op.lhs, "first source", operation);
			const uint32 r = s.get(op.rhs, "second source", operation);
			if (r == 0)
			{
				CAGE_THROW_ERROR(VmError, "division by zero", ErrorKindEnum::DivisionByZero,
					ErrorContext{ operation, "attempted to divide by zero", "ensure the divisor is not zero" });
			}
			s.set(op.dst, l % r, "destination", operation);
		}

		void cmp(MachineState &s, const ops::Cmp &op)
		{
			const char *const operation = "executing CMP";
			const uint32 l = s.get(op.lhs, "first source", operation);
			const uint32 r = s.get(op.rhs, "second source", operation);
			if (l == r)
				s.compareFlag_ = 0;
			else if (l > r)
				s.compareFlag_ = 1;
			else
				s.compareFlag_ = -1;
		}

		void jmp(MachineState &s, const ops::Jmp &op)
		{
			s.checkTarget(op.target, "executing JMP");
			s.jump(op.target);
		}

		void jeq(MachineState &s, const ops::Jeq &op)
		{
			s.checkTarget(op.target, "executing JEQ");
			if (s.compareFlag_ == 0)
				s.jump(op.target);
		}

		void jne(MachineState &s, const ops::Jne &op)
		{
			s.checkTarget(op.target, "executing JNE");
			if (s.compareFlag_ != 0)
				s.jump(op.target);
		}

		void jgt(MachineState &s, const ops::Jgt &op)
		{
			s.checkTarget(op.target, "executing JGT");
			if (s.compareFlag_ > 0)
				s.jump(op.target);
		}

		void jlt(MachineState &s, const ops::Jlt &op)
		{
			s.checkTarget(op.target, "executing JLT");
			if (s.compareFlag_ < 0)
				s.jump(op.target);
		}

		void jge(MachineState &s, const ops::Jge &op)
		{
			s.checkTarget(op.target, "executing JGE");
			if (s.compareFlag_ >= 0)
				s.jump(op.target);
		}

		void push(MachineState &s, const ops::Push &op)
		{
			const uint32 v = s.get(op.src, "source", "executing PUSH");
			s.push(v, "executing PUSH");
		}

		void pop(MachineState &s, const ops::Pop &op)
		{
			const char *const operation = "executing POP";
			s.get(op.dst, "destination", operation);
			s.set(op.dst, s.pop(operation), "destination", operation);
		}

		void store(MachineState &s, const ops::Store &op)
		{
			const char *const operation = "executing STORE";
			const uint32 v = s.get(op.src, "source", operation);
			s.checkMemoryRange(op.address, sizeof(uint32), operation);
			detail::memcpy(s.memory_.data() + op.address, &v, sizeof(uint32));
			s.recordMemoryAccess(op.address, v, true);
		}

		void loadMem(MachineState &s, const ops::LoadMem &op)
		{
			const char *const operation = "executing LOAD_MEM";
			s.get(op.dst, "destination", operation);
			s.checkMemoryRange(op.address, sizeof(uint32), operation);
			uint32 v = 0;
			detail::memcpy(&v, s.memory_.data() + op.address, sizeof(uint32));
			s.set(op.dst, v, "destination", operation);
			s.recordMemoryAccess(op.address, v, false);
		}

		void memcpy(MachineState &s, const ops::Memcpy &op)
		{
			const char *const operation = "executing MEMCPY";
			if (op.length == 0)
				return;
			s.checkMemoryRange(op.dst, op.length, operation);
			s.checkMemoryRange(op.src, op.length, operation);
			uint8 *mem = s.memory_.data();
			detail::memmove(mem + op.dst, mem + op.src, op.length);
		}

		void call(MachineState &s, const ops::Call &op)
		{
			const char *const operation = "executing CALL";
			s.checkTarget(op.target, operation);
			s.push(s.programCounter_ + 1, operation);
			s.jump(op.target);
		}

		void ret(MachineState &s)
		{
			const char *const operation = "executing RET";
			if (!s.stack_.empty() && s.stack_.back() > s.program_.size())
			{
				CAGE_THROW_ERROR(VmError, "return address out of range", ErrorKindEnum::InvalidInstruction,
					ErrorContext{ operation, stringizer() + "return address " + s.stack_.back() + " is outside of the program", "return only to addresses pushed by CALL" });
			}
			s.jump(s.pop(operation));
		}
	}

	namespace
	{
		struct Dispatcher
		{
			MachineState &s;

			void operator () (const ops::Halt &) const { instructions::halt(s); }
			void operator () (const ops::Load &op) const { instructions::load(s, op); }
			void operator () (const ops::Add &op) const { instructions::add(s, op); }
			void operator () (const ops::Sub &op) const { instructions::sub(s, op); }
			void operator () (const ops::Mul &op) const { instructions::mul(s, op); }
			void operator () (const ops::Div &op) const { instructions::div(s, op); }
			void operator () (const ops::Mod &op) const { instructions::mod(s, op); }
			void operator () (const ops::Cmp &op) const { instructions::cmp(s, op); }
			void operator () (const ops::Jmp &op) const { instructions::jmp(s, op); }
			void operator () (const ops::Jeq &op) const { instructions::jeq(s, op); }
			void operator () (const ops::Jne &op) const { instructions::jne(s, op); }
			void operator () (const ops::Jgt &op) const { instructions::jgt(s, op); }
			void operator () (const ops::Jlt &op) const { instructions::jlt(s, op); }
			void operator () (const ops::Jge &op) const { instructions::jge(s, op); }
			void operator () (const ops::Push &op) const { instructions::push(s, op); }
			void operator () (const ops::Pop &op) const { instructions::pop(s, op); }
			void operator () (const ops::Store &op) const { instructions::store(s, op); }
			void operator () (const ops::LoadMem &op) const { instructions::loadMem(s, op); }
			void operator () (const ops::Memcpy &op) const { instructions::memcpy(s, op); }
			void operator () (const ops::Call &op) const { instructions::call(s, op); }
			void operator () (const ops::Ret &) const { instructions::ret(s); }
		};
	}

	void dispatch(MachineState &state, const Operation &operation)
	{
		std::visit(Dispatcher{ state }, operation);
	}
}
