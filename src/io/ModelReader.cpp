#include <qgen/io/ModelReader.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <qgen/util/exception.hpp>
#include <qgen/util/fn.hpp>
#include <qgen/util/macro.hpp>
#include <string_view>


using namespace qg;


namespace {

bool is_blank(char c) { return std::isspace(static_cast<unsigned char>(c)); }

std::string to_lower(std::string str)
{
    for (auto &c : str)
        c = std::tolower(static_cast<unsigned char>(c));
    return str;
}

}


ModelReader::ModelReader(Diagnostic &diag) : ModelReader(diag, Config()) { }

ModelReader::ModelReader(Diagnostic &diag, Config cfg)
    : cfg_(cfg)
    , diag_(diag)
{
    if (config().delimiter == config().quote)
        throw invalid_argument("delimiter and quote must not be the same character");
    if (config().delimiter == config().escape)
        throw invalid_argument("delimiter and escape must not be the same character");
}

QueryModel ModelReader::operator()(std::istream &in, const char *name)
{
    name_ = name;

    QueryModel model;
    std::string line;
    std::vector<Field> fields;
    for (unsigned lineno = 1; std::getline(in, line); ++lineno) {
        if (not line.empty() and line.back() == '\r')
            line.pop_back(); // tolerate CRLF line endings
        if (qg::isspace(line) or trim(line).front() == config().comment)
            continue;
        if (split(line, lineno, fields))
            apply(model, fields, lineno);
    }
    return model;
}

bool ModelReader::split(const std::string &line, unsigned lineno, std::vector<Field> &fields)
{
    fields.clear();
    const std::size_t len = line.size();
    std::size_t i = 0;

    for (;;) {
        while (i < len and is_blank(line[i])) ++i;
        Field field{ std::string(), unsigned(i + 1) };

        if (i < len and line[i] == config().quote) {
            /*----- Quoted field. ------------------------------------------------------------------------------------*/
            bool closed = false;
            for (++i; i < len; ) {
                const char c = line[i++];
                if (c == config().escape and i < len) {
                    field.text.push_back(line[i++]);
                } else if (c == config().quote) {
                    closed = true;
                    break;
                } else {
                    field.text.push_back(c);
                }
            }
            if (not closed) {
                diag_.e(pos(lineno, field.column)) << "unterminated quoted field\n";
                return false;
            }
            while (i < len and is_blank(line[i])) ++i;
            if (i < len and line[i] != config().delimiter) {
                diag_.e(pos(lineno, i + 1)) << "expected '" << config().delimiter << "' after quoted field\n";
                return false;
            }
        } else {
            /*----- Plain field. -------------------------------------------------------------------------------------*/
            auto end = line.find(config().delimiter, i);
            if (end == std::string::npos) end = len;
            field.text = trim(std::string_view(line).substr(i, end - i));
            i = end;
        }

        fields.push_back(std::move(field));
        if (i >= len)
            return true;
        ++i; // skip delimiter
    }
}

bool ModelReader::check_arity(const std::vector<Field> &fields, unsigned lineno, std::size_t min, std::size_t max)
{
    if (fields.size() >= min and fields.size() <= max)
        return true;
    auto &e = diag_.e(pos(lineno, fields.front().column));
    e << "record '" << fields.front().text << "' expects ";
    if (min == max)
        e << min - 1;
    else
        e << min - 1 << " to " << max - 1;
    e << " argument(s), got " << fields.size() - 1 << '\n';
    return false;
}

bool ModelReader::require(const Field &field, unsigned lineno, const char *what)
{
    if (not field.text.empty())
        return true;
    diag_.e(pos(lineno, field.column)) << "missing " << what << '\n';
    return false;
}

void ModelReader::apply(QueryModel &model, const std::vector<Field> &fields, unsigned lineno)
{
    QG_insist(not fields.empty(), "split yields at least one field");

    /* Returns the text of the optional field at `idx`, if given and non-empty. */
    auto given = [&fields](std::size_t idx) -> std::optional<std::string> {
        if (idx < fields.size() and not fields[idx].text.empty())
            return fields[idx].text;
        return std::nullopt;
    };

    const std::string kind = to_lower(fields[0].text);

    if (kind == "distinct") {
        if (not check_arity(fields, lineno, 1, 1)) return;
        if (model.distinct())
            diag_.w(pos(lineno, fields[0].column)) << "repeated record 'distinct'\n";
        model.distinct(true);
    } else if (kind == "select") {
        if (not check_arity(fields, lineno, 2, 3) or not require(fields[1], lineno, "selection expression")) return;
        model.add_selection(fields[1].text, given(2));
    } else if (kind == "table") {
        if (not check_arity(fields, lineno, 2, 3) or not require(fields[1], lineno, "table name")) return;
        model.add_table(TableRef(fields[1].text, given(2)));
    } else if (kind == "join") {
        if (not check_arity(fields, lineno, 6, 8) or
            not require(fields[1], lineno, "left table name") or
            not require(fields[3], lineno, "right table name") or
            not require(fields[5], lineno, "join condition"))
            return;

        JoinType type = J_Inner;
        if (auto name = given(7)) {
            auto lower = to_lower(*name);
            if (lower == "inner")      type = J_Inner;
            else if (lower == "left")  type = J_LeftOuter;
            else if (lower == "right") type = J_RightOuter;
            else if (lower == "full")  type = J_FullOuter;
            else {
                diag_.e(pos(lineno, fields[7].column)) << "unknown join type '" << *name
                                                       << "', expected inner, left, right, or full\n";
                return;
            }
        }
        model.add_join(JoinEdge(TableRef(fields[1].text, given(2)), TableRef(fields[3].text, given(4)),
                                fields[5].text, given(6).value_or(std::string()), type));
    } else if (kind == "where") {
        if (not check_arity(fields, lineno, 2, 2) or not require(fields[1], lineno, "predicate")) return;
        model.add_where(fields[1].text);
    } else if (kind == "group") {
        if (not check_arity(fields, lineno, 2, 2) or not require(fields[1], lineno, "grouping expression")) return;
        model.add_group_by(fields[1].text);
    } else if (kind == "having") {
        if (not check_arity(fields, lineno, 2, 2) or not require(fields[1], lineno, "predicate")) return;
        model.add_having(fields[1].text);
    } else if (kind == "order") {
        if (not check_arity(fields, lineno, 2, 3) or not require(fields[1], lineno, "ordering expression")) return;
        bool ascending = true;
        if (auto dir = given(2)) {
            auto lower = to_lower(*dir);
            if (lower == "desc")
                ascending = false;
            else if (lower != "asc") {
                diag_.e(pos(lineno, fields[2].column)) << "unknown sort direction '" << *dir
                                                       << "', expected asc or desc\n";
                return;
            }
        }
        model.add_order_by(OrderItem(fields[1].text, ascending));
    } else if (kind == "limit") {
        if (not check_arity(fields, lineno, 2, 2) or not require(fields[1], lineno, "row limit")) return;
        auto &text = fields[1].text;
        uint64_t limit;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), limit);
        if (ec != std::errc() or ptr != text.data() + text.size()) {
            diag_.e(pos(lineno, fields[1].column)) << "invalid row limit '" << text << "'\n";
            return;
        }
        if (model.limit())
            diag_.w(pos(lineno, fields[0].column)) << "row limit overrides previous limit " << *model.limit() << '\n';
        model.limit(limit);
    } else {
        diag_.e(pos(lineno, fields[0].column)) << "unknown record kind '" << fields[0].text << "'\n";
    }
}
