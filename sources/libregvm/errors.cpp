#include <cage-core/pointerRangeHolder.h>

#include <regvm/regvm.h>

namespace regvm
{
	const char *errorKindName(ErrorKindEnum kind)
	{
		switch (kind)
		{
		case ErrorKindEnum::OutOfMemory: return "OutOfMemory";
		case ErrorKindEnum::MemoryAccessViolation: return "MemoryAccessViolation";
		case ErrorKindEnum::StackOverflow: return "StackOverflow";
		case ErrorKindEnum::StackUnderflow: return "StackUnderflow";
		case ErrorKindEnum::InvalidInstruction: return "InvalidInstruction";
		case ErrorKindEnum::UnsupportedOperation: return "UnsupportedOperation";
		case ErrorKindEnum::DivisionByZero: return "DivisionByZero";
		case ErrorKindEnum::TypeMismatch: return "TypeMismatch";
		case ErrorKindEnum::ResourceExhausted: return "ResourceExhausted";
		case ErrorKindEnum::InvalidConfiguration: return "InvalidConfiguration";
		case ErrorKindEnum::InvalidFunctionCall: return "InvalidFunctionCall";
		case ErrorKindEnum::InvalidMemoryAccess: return "InvalidMemoryAccess";
		case ErrorKindEnum::InvalidAlignment: return "InvalidAlignment";
		case ErrorKindEnum::SecurityViolation: return "SecurityViolation";
		case ErrorKindEnum::IntegerOverflow: return "IntegerOverflow";
		case ErrorKindEnum::IntegerUnderflow: return "IntegerUnderflow";
		}
		return "Unknown";
	}

	VmError::VmError(StringLiteral file, uint32 line, StringLiteral function, SeverityEnum severity, StringLiteral message, ErrorKindEnum kind, const ErrorContext &context) noexcept : Exception(file, line, function, severity, message), context(context), kind(kind)
	{}

	void VmError::log()
	{
		const auto report = errorReport(*this);
		for (const string &l : *report)
			CAGE_LOG(SeverityEnum::Note, "regvm", l);
		Exception::log();
	}

	Holder<PointerRange<string>> errorReport(const VmError &error)
	{
		PointerRangeHolder<string> lines;
		lines.push_back(stringizer() + "Error: " + errorKindName(error.kind));
		if (error.context.operation)
			lines.push_back(stringizer() + "During: " + error.context.operation);
		if (error.context.location)
		{
			const SourceLocation &loc = *error.context.location;
			if (loc.file)
				lines.push_back(stringizer() + "In file: " + loc.file);
			lines.push_back(stringizer() + "At line " + loc.line + ", column " + loc.column);
		}
		lines.push_back(stringizer() + "Details: " + error.context.details);
		if (error.context.suggestion)
			lines.push_back(stringizer() + "Suggestion: " + error.context.suggestion);
		return lines;
	}
}
