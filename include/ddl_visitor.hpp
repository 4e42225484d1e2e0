#pragma once
#include <sstream>
#include <string>
#include <vector>
#include "operation.hpp"

/**
 * Renders operations as SQL DDL.
 *  - forwards(): statement applying the operation
 *  - backwards(): statement reverting it
 * Dialects only differ in column types and auto-increment keys.
 */
class DDLVisitor {
public:
    virtual ~DDLVisitor() = default;

    std::string forwards(const Operation& op);
    std::string backwards(const Operation& op);

    // one statement per line; backwards walks the operations last to first
    std::string forwards(const std::vector<Operation>& ops);
    std::string backwards(const std::vector<Operation>& ops);

    virtual std::string sql_type(const FieldDescriptor& f) = 0;

protected:
    // "name TYPE [PRIMARY KEY] [NOT NULL] [UNIQUE] [REFERENCES t(c)]"
    virtual std::string column_def(const FieldDescriptor& f, bool inline_pk);

    std::string create_table(const std::string& table, const std::vector<FieldDescriptor>& fields);
    std::string drop_table(const std::string& table);
    std::string add_column(const std::string& table, const FieldDescriptor& f);
    std::string drop_column(const std::string& table, const std::string& column);
};

class PgDDLVisitor : public DDLVisitor {
public:
    std::string sql_type(const FieldDescriptor& f) override;
};

class SqliteDDLVisitor : public DDLVisitor {
public:
    std::string sql_type(const FieldDescriptor& f) override;
protected:
    std::string column_def(const FieldDescriptor& f, bool inline_pk) override;
};
