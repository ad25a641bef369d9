//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Program binary codec and disassembler.
//
// Layout (all integers little-endian):
//   u32 magic, u16 version
//   names:    u32 count, then u32 length + bytes per name
//   literals: u32 count, then tagged values
//   labels:   u32 count, then u32 id, u8 has-name, u32 name, u32 position
//   main:     u32 count, then instructions (u8 tag + operands)
//   forks:    u32 count, then a main-style vector per fork
//   spans:    u32 count, then u32 pc + u32 line; then the same per fork
//
// Instruction operands are written in fields() order, so the codec follows
// the instruction set without per-opcode code.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Encoding, decoding and listing of compiled programs.

#include "compiler/Program.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <sstream>

namespace moo::compiler
{
using support::Diag;
using support::Expected;
using values::Var;
using values::VarType;

size_t Program::findLine(std::optional<size_t> forkVector, size_t pc) const
{
    const auto &spans = forkVector ? forkLineNumberSpans.at(*forkVector) : lineNumberSpans;
    size_t line = 0;
    for (const auto &span : spans)
    {
        if (span.pc > pc)
            break;
        line = span.line;
    }
    return line;
}

namespace
{
class Writer
{
  public:
    void u8(uint8_t v)
    {
        out_.push_back(v);
    }

    void u16(uint16_t v)
    {
        for (int i = 0; i < 2; ++i)
            out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    void u32(uint32_t v)
    {
        for (int i = 0; i < 4; ++i)
            out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    void u64(uint64_t v)
    {
        for (int i = 0; i < 8; ++i)
            out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    void str(const std::string &s)
    {
        u32(static_cast<uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    void write(Label l)
    {
        u32(l.id);
    }

    void write(Name n)
    {
        u32(n.id);
    }

    void write(Offset o)
    {
        u32(o.value);
    }

    void write(int32_t v)
    {
        u32(static_cast<uint32_t>(v));
    }

    void write(uint32_t v)
    {
        u32(v);
    }

    void write(uint16_t v)
    {
        u16(v);
    }

    template <typename T> void write(const std::optional<T> &v)
    {
        u8(v ? 1 : 0);
        if (v)
            write(*v);
    }

    void write(const ScatterLabel &sl)
    {
        u8(static_cast<uint8_t>(sl.kind));
        write(sl.id);
        write(sl.label);
    }

    template <typename T> void write(const std::vector<T> &items)
    {
        u32(static_cast<uint32_t>(items.size()));
        for (const auto &item : items)
            write(item);
    }

    void write(const Op &op)
    {
        u8(static_cast<uint8_t>(op.index()));
        std::visit(
            [this](const auto &o)
            {
                using T = std::decay_t<decltype(o)>;
                if constexpr (kOpHasFields<const T>)
                    std::apply([this](const auto &...f) { (write(f), ...); }, o.fields());
            },
            op);
    }

    void write(const Var &v)
    {
        u8(static_cast<uint8_t>(v.type()));
        switch (v.type())
        {
            case VarType::Int:
                u64(static_cast<uint64_t>(v.asInt()));
                break;
            case VarType::Obj:
                u64(static_cast<uint64_t>(v.asObj()));
                break;
            case VarType::Float:
                u64(std::bit_cast<uint64_t>(v.asFloat()));
                break;
            case VarType::Str:
                str(v.asStr());
                break;
            case VarType::Err:
                u8(static_cast<uint8_t>(v.asErr()));
                break;
            case VarType::List:
                write(v.asList());
                break;
            case VarType::Catch:
            case VarType::Finally:
                u32(v.markerLabel());
                break;
            case VarType::Clear:
            case VarType::None:
                break;
        }
    }

    void write(const JumpLabel &jl)
    {
        write(jl.id);
        write(jl.name);
        u32(static_cast<uint32_t>(jl.position));
    }

    void write(const LineSpan &span)
    {
        u32(static_cast<uint32_t>(span.pc));
        u32(static_cast<uint32_t>(span.line));
    }

    std::vector<uint8_t> take()
    {
        return std::move(out_);
    }

  private:
    std::vector<uint8_t> out_;
};

/// Cursor over the encoded bytes. Every read returns false once the first
/// failure has been recorded; the failure is available through error().
class Reader
{
  public:
    explicit Reader(std::span<const uint8_t> bytes) : bytes_(bytes) {}

    bool u8(uint8_t &v)
    {
        if (!need(1))
            return false;
        v = bytes_[pos_++];
        return true;
    }

    bool u16(uint16_t &v)
    {
        if (!need(2))
            return false;
        v = 0;
        for (int i = 0; i < 2; ++i)
            v = static_cast<uint16_t>(v | (bytes_[pos_++] << (8 * i)));
        return true;
    }

    bool u32(uint32_t &v)
    {
        if (!need(4))
            return false;
        v = 0;
        for (int i = 0; i < 4; ++i)
            v |= static_cast<uint32_t>(bytes_[pos_++]) << (8 * i);
        return true;
    }

    bool u64(uint64_t &v)
    {
        if (!need(8))
            return false;
        v = 0;
        for (int i = 0; i < 8; ++i)
            v |= static_cast<uint64_t>(bytes_[pos_++]) << (8 * i);
        return true;
    }

    bool str(std::string &s)
    {
        uint32_t len = 0;
        if (!u32(len) || !need(len))
            return false;
        s.assign(reinterpret_cast<const char *>(bytes_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    bool read(Label &l)
    {
        return u32(l.id);
    }

    bool read(Name &n)
    {
        return u32(n.id);
    }

    bool read(Offset &o)
    {
        return u32(o.value);
    }

    bool read(int32_t &v)
    {
        uint32_t raw = 0;
        if (!u32(raw))
            return false;
        v = static_cast<int32_t>(raw);
        return true;
    }

    bool read(uint32_t &v)
    {
        return u32(v);
    }

    bool read(uint16_t &v)
    {
        return u16(v);
    }

    template <typename T> bool read(std::optional<T> &v)
    {
        uint8_t present = 0;
        if (!u8(present))
            return false;
        if (present > 1)
            return fail(DecodeErrorKind::BadTag, "bad optional flag");
        if (!present)
        {
            v.reset();
            return true;
        }
        T inner{};
        if (!read(inner))
            return false;
        v = inner;
        return true;
    }

    bool read(ScatterLabel &sl)
    {
        uint8_t kind = 0;
        if (!u8(kind))
            return false;
        if (kind > static_cast<uint8_t>(ScatterKind::Rest))
            return fail(DecodeErrorKind::BadTag, "bad scatter kind");
        sl.kind = static_cast<ScatterKind>(kind);
        return read(sl.id) && read(sl.label);
    }

    template <typename T> bool read(std::vector<T> &items)
    {
        uint32_t count = 0;
        if (!u32(count))
            return false;
        items.clear();
        for (uint32_t i = 0; i < count; ++i)
        {
            T item{};
            if (!read(item))
                return false;
            items.push_back(std::move(item));
        }
        return true;
    }

    bool read(Op &op);

    bool read(Var &v)
    {
        uint8_t tag = 0;
        if (!u8(tag))
            return false;
        uint64_t raw = 0;
        switch (static_cast<VarType>(tag))
        {
            case VarType::Int:
                if (!u64(raw))
                    return false;
                v = Var::fromInt(static_cast<int64_t>(raw));
                return true;
            case VarType::Obj:
                if (!u64(raw))
                    return false;
                v = Var::fromObj(static_cast<int64_t>(raw));
                return true;
            case VarType::Float:
                if (!u64(raw))
                    return false;
                v = Var::fromFloat(std::bit_cast<double>(raw));
                return true;
            case VarType::Str:
            {
                std::string s;
                if (!str(s))
                    return false;
                v = Var::fromStr(std::move(s));
                return true;
            }
            case VarType::Err:
            {
                uint8_t code = 0;
                if (!u8(code))
                    return false;
                auto err = values::errorFromRaw(code);
                if (!err)
                    return fail(DecodeErrorKind::BadTag, "bad error code");
                v = Var::fromErr(*err);
                return true;
            }
            case VarType::List:
            {
                std::vector<Var> items;
                if (!read(items))
                    return false;
                v = Var::fromList(std::move(items));
                return true;
            }
            case VarType::Catch:
            case VarType::Finally:
            {
                uint32_t label = 0;
                if (!u32(label))
                    return false;
                v = static_cast<VarType>(tag) == VarType::Catch ? Var::catchMarker(label)
                                                                 : Var::finallyMarker(label);
                return true;
            }
            case VarType::Clear:
                v = Var::clear();
                return true;
            case VarType::None:
                v = Var::none();
                return true;
        }
        return fail(DecodeErrorKind::BadTag, "bad value tag " + std::to_string(tag));
    }

    bool read(JumpLabel &jl)
    {
        uint32_t position = 0;
        if (!read(jl.id) || !read(jl.name) || !u32(position))
            return false;
        jl.position = position;
        return true;
    }

    bool read(LineSpan &span)
    {
        uint32_t pc = 0;
        uint32_t line = 0;
        if (!u32(pc) || !u32(line))
            return false;
        span = LineSpan{pc, line};
        return true;
    }

    bool fail(DecodeErrorKind kind, std::string msg)
    {
        if (!error_)
            error_ = support::makeCodedError(
                static_cast<uint32_t>(kind),
                "program decode: " + msg + " at byte " + std::to_string(pos_));
        return false;
    }

    bool atEnd() const
    {
        return pos_ == bytes_.size();
    }

    const Diag &error() const
    {
        return *error_;
    }

  private:
    bool need(size_t n)
    {
        if (error_)
            return false;
        if (bytes_.size() - pos_ < n)
            return fail(DecodeErrorKind::Truncated, "unexpected end of input");
        return true;
    }

    std::span<const uint8_t> bytes_;
    size_t pos_ = 0;
    std::optional<Diag> error_;
};

template <size_t I> bool decodeAlternative(Reader &r, Op &out)
{
    std::variant_alternative_t<I, Op> op{};
    if constexpr (kOpHasFields<decltype(op)>)
    {
        bool ok = std::apply([&r](auto &...f) { return (r.read(f) && ...); }, op.fields());
        if (!ok)
            return false;
    }
    out.emplace<I>(std::move(op));
    return true;
}

template <size_t... I> constexpr auto makeDecodeTable(std::index_sequence<I...>)
{
    return std::array<bool (*)(Reader &, Op &), sizeof...(I)>{&decodeAlternative<I>...};
}

constexpr auto kDecodeTable = makeDecodeTable(std::make_index_sequence<std::variant_size_v<Op>>{});

bool Reader::read(Op &op)
{
    uint8_t tag = 0;
    if (!u8(tag))
        return false;
    if (tag >= kDecodeTable.size())
        return fail(DecodeErrorKind::BadTag, "bad opcode tag " + std::to_string(tag));
    return kDecodeTable[tag](*this, op);
}
} // namespace

std::vector<uint8_t> encodeProgram(const Program &program)
{
    Writer w;
    w.u32(kProgramMagic);
    w.u16(kProgramVersion);
    w.u32(static_cast<uint32_t>(program.varNames.width()));
    for (const auto &name : program.varNames.names())
        w.str(name);
    w.write(program.literals);
    w.write(program.jumpLabels);
    w.write(program.mainVector);
    w.write(program.forkVectors);
    w.write(program.lineNumberSpans);
    w.write(program.forkLineNumberSpans);
    return w.take();
}

Expected<Program> decodeProgram(std::span<const uint8_t> bytes)
{
    Reader r(bytes);
    uint32_t magic = 0;
    uint16_t version = 0;
    if (!r.u32(magic))
        return r.error();
    if (magic != kProgramMagic)
    {
        r.fail(DecodeErrorKind::BadMagic, "bad magic");
        return r.error();
    }
    if (!r.u16(version))
        return r.error();
    if (version != kProgramVersion)
    {
        r.fail(DecodeErrorKind::UnsupportedVersion,
               "unsupported version " + std::to_string(version));
        return r.error();
    }

    uint32_t nameCount = 0;
    if (!r.u32(nameCount))
        return r.error();
    std::vector<std::string> names;
    for (uint32_t i = 0; i < nameCount; ++i)
    {
        std::string name;
        if (!r.str(name))
            return r.error();
        names.push_back(std::move(name));
    }

    Program program;
    program.varNames = Names(std::move(names));
    if (!r.read(program.literals) || !r.read(program.jumpLabels) || !r.read(program.mainVector) ||
        !r.read(program.forkVectors) || !r.read(program.lineNumberSpans) ||
        !r.read(program.forkLineNumberSpans))
        return r.error();
    if (!r.atEnd())
    {
        r.fail(DecodeErrorKind::TrailingBytes, "trailing bytes");
        return r.error();
    }
    return program;
}

std::string disassemble(const Program &program)
{
    std::ostringstream os;
    os << "names:";
    for (size_t i = 0; i < program.varNames.width(); ++i)
        os << ' ' << 'n' << i << '=' << program.varNames.names()[i];
    os << "\nliterals:\n";
    for (size_t i = 0; i < program.literals.size(); ++i)
        os << "  " << i << ": " << program.literals[i].toLiteral() << '\n';
    os << "labels:\n";
    for (const auto &jl : program.jumpLabels)
    {
        os << "  L" << jl.id.id << " -> " << jl.position;
        if (jl.name)
            os << " (" << program.varNames.name(*jl.name) << ')';
        os << '\n';
    }

    auto listVector = [&](const std::vector<Op> &ops, std::optional<size_t> fv)
    {
        for (size_t pc = 0; pc < ops.size(); ++pc)
        {
            os << "  " << pc << ": " << formatOp(ops[pc]);
            if (const auto *imm = std::get_if<op::Imm>(&ops[pc]);
                imm && imm->literal < program.literals.size())
                os << "  ; " << program.literals[imm->literal].toLiteral();
            os << "  ; line " << program.findLine(fv, pc) << '\n';
        }
    };
    os << "main:\n";
    listVector(program.mainVector, std::nullopt);
    for (size_t fv = 0; fv < program.forkVectors.size(); ++fv)
    {
        os << "fork " << fv << ":\n";
        listVector(program.forkVectors[fv], fv);
    }
    return os.str();
}

} // namespace moo::compiler
