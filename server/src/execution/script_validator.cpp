#include "python_runtime.h"
#include "script_validator.h"
#include <vector>
#include "log/logger.h"

namespace scripthub::exec {

std::string ValidationCodeToString(ValidationCode code)
{
    switch (code) {
        case ValidationCode::Ok:                return "Ok";
        case ValidationCode::SyntaxInvalid:     return "SyntaxInvalid";
        case ValidationCode::MissingEntryPoint: return "MissingEntryPoint";
        case ValidationCode::BadSignature:      return "BadSignature";
        case ValidationCode::BadParameterType:  return "BadParameterType";
        case ValidationCode::InternalError:     return "InternalError";
        default: return "Unknown";
    }
}

namespace {

ValidationVerdict reject(ValidationCode code, std::string message)
{
    ValidationVerdict v;
    v.valid = false;
    v.code = code;
    v.message = std::move(message);
    return v;
}

// 语法树里用到的节点类型
struct AstTypes {
    PyObjectPtr module;
    PyObjectPtr parse;
    PyObjectPtr walk;
    PyObjectPtr functionDef;
    PyObjectPtr name;
    PyObjectPtr attribute;
    PyObjectPtr subscript;
    PyObjectPtr constant;

    bool load(std::string& error) {
        module.reset(PyImport_ImportModule("ast"));
        if (!module) {
            error = fetchPythonError();
            return false;
        }
        auto attr = [&](PyObjectPtr& out, const char* n) {
            out.reset(PyObject_GetAttrString(module.get(), n));
            return static_cast<bool>(out);
        };
        if (!attr(parse, "parse") || !attr(walk, "walk") ||
            !attr(functionDef, "FunctionDef") || !attr(name, "Name") ||
            !attr(attribute, "Attribute") || !attr(subscript, "Subscript") ||
            !attr(constant, "Constant")) {
            error = fetchPythonError();
            return false;
        }
        return true;
    }
};

bool isInstance(PyObject* obj, const PyObjectPtr& type)
{
    const int r = PyObject_IsInstance(obj, type.get());
    if (r < 0) {
        PyErr_Clear();
        return false;
    }
    return r == 1;
}

std::string stringAttr(PyObject* obj, const char* attr)
{
    PyObjectPtr v(PyObject_GetAttrString(obj, attr));
    if (!v) {
        PyErr_Clear();
        return {};
    }
    if (!PyUnicode_Check(v.get())) return {};
    return pyToString(v.get());
}

long longAttr(PyObject* obj, const char* attr)
{
    PyObjectPtr v(PyObject_GetAttrString(obj, attr));
    if (!v || v.get() == Py_None) {
        PyErr_Clear();
        return 0;
    }
    const long n = PyLong_AsLong(v.get());
    if (n == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return 0;
    }
    return n;
}

Py_ssize_t listAttrSize(PyObject* obj, const char* attr)
{
    PyObjectPtr v(PyObject_GetAttrString(obj, attr));
    if (!v) {
        PyErr_Clear();
        return 0;
    }
    const Py_ssize_t n = PySequence_Size(v.get());
    if (n < 0) {
        PyErr_Clear();
        return 0;
    }
    return n;
}

bool attrIsNone(PyObject* obj, const char* attr)
{
    PyObjectPtr v(PyObject_GetAttrString(obj, attr));
    if (!v) {
        PyErr_Clear();
        return true;
    }
    return v.get() == Py_None;
}

// SyntaxError -> "invalid Python syntax at line L, column C:\n<line>\n   ^\n<msg>"
std::string formatSyntaxError()
{
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    PyObjectPtr t(type), v(value), tb(traceback);

    std::string out = "invalid Python syntax";
    if (!v) return out;

    const long lineno = longAttr(v.get(), "lineno");
    const long offset = longAttr(v.get(), "offset");
    std::string text = stringAttr(v.get(), "text");
    const std::string msg = stringAttr(v.get(), "msg");

    if (lineno > 0) out += " at line " + std::to_string(lineno);
    if (offset > 0) out += (lineno > 0 ? ", column " : " at column ") + std::to_string(offset);

    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    if (!text.empty()) {
        out += ":\n" + text;
        if (offset > 0) {
            out += "\n" + std::string(static_cast<size_t>(offset - 1), ' ') + "^";
        }
    }
    if (!msg.empty()) {
        out += "\n" + msg;
    } else if (text.empty()) {
        const std::string fallback = pyToString(v.get());
        if (!fallback.empty()) out += ": " + fallback;
    }
    return out;
}

// dict / Dict / typing.Dict
bool isDictName(PyObject* node, const AstTypes& ast)
{
    std::string id;
    if (isInstance(node, ast.name)) {
        id = stringAttr(node, "id");
    } else if (isInstance(node, ast.attribute)) {
        id = stringAttr(node, "attr");
    } else {
        return false;
    }
    return id == "dict" || id == "Dict";
}

bool isDictAnnotation(PyObject* node, const AstTypes& ast)
{
    if (isDictName(node, ast)) return true;

    // dict[str, Any] / Dict[str, int]
    if (isInstance(node, ast.subscript)) {
        PyObjectPtr value(PyObject_GetAttrString(node, "value"));
        if (!value) {
            PyErr_Clear();
            return false;
        }
        return isDictName(value.get(), ast);
    }

    // 字符串形式的前向引用："dict" / "dict[str, Any]"
    if (isInstance(node, ast.constant)) {
        const std::string s = stringAttr(node, "value");
        return s == "dict" || s == "Dict" ||
               s.rfind("dict[", 0) == 0 || s.rfind("Dict[", 0) == 0 ||
               s.rfind("typing.Dict", 0) == 0;
    }
    return false;
}

// 广度优先找第一个名为 main 的 FunctionDef（包括嵌套定义），返回新引用
PyObjectPtr findEntryFunction(PyObject* tree, const AstTypes& ast, std::string& error)
{
    PyObjectPtr walker(PyObject_CallFunctionObjArgs(ast.walk.get(), tree, nullptr));
    if (!walker) {
        error = fetchPythonError();
        return nullptr;
    }
    PyObjectPtr it(PyObject_GetIter(walker.get()));
    if (!it) {
        error = fetchPythonError();
        return nullptr;
    }

    while (true) {
        PyObjectPtr node(PyIter_Next(it.get()));
        if (!node) break;
        if (isInstance(node.get(), ast.functionDef) &&
            stringAttr(node.get(), "name") == ScriptValidator::kEntryFunction) {
            return node;
        }
    }
    if (PyErr_Occurred()) {
        error = fetchPythonError();
    }
    return nullptr;
}

ValidationVerdict checkSignature(PyObject* func, const AstTypes& ast)
{
    PyObjectPtr args(PyObject_GetAttrString(func, "args"));
    if (!args) {
        return reject(ValidationCode::InternalError, "validation error: " + fetchPythonError());
    }

    const Py_ssize_t positional = listAttrSize(args.get(), "posonlyargs") +
                                  listAttrSize(args.get(), "args");
    const Py_ssize_t total = positional +
                             listAttrSize(args.get(), "kwonlyargs") +
                             (attrIsNone(args.get(), "vararg") ? 0 : 1) +
                             (attrIsNone(args.get(), "kwarg") ? 0 : 1);

    if (positional != 1 || total != 1) {
        return reject(ValidationCode::BadSignature,
                      "function 'main' must take exactly one argument of type dict");
    }

    // 唯一的参数：posonlyargs 或 args 里的那一个
    const char* listName = listAttrSize(args.get(), "posonlyargs") == 1 ? "posonlyargs" : "args";
    PyObjectPtr list(PyObject_GetAttrString(args.get(), listName));
    PyObjectPtr arg(list ? PySequence_GetItem(list.get(), 0) : nullptr);
    if (!arg) {
        return reject(ValidationCode::InternalError, "validation error: " + fetchPythonError());
    }

    PyObjectPtr annotation(PyObject_GetAttrString(arg.get(), "annotation"));
    if (!annotation) {
        PyErr_Clear();
        annotation.reset(Py_NewRef(Py_None));
    }

    // 未注解：放行（注解只是提示）
    if (annotation.get() != Py_None && !isDictAnnotation(annotation.get(), ast)) {
        return reject(ValidationCode::BadParameterType,
                      "argument of function 'main' must be of type dict");
    }

    ValidationVerdict ok;
    ok.valid = true;
    ok.code = ValidationCode::Ok;
    return ok;
}

} // namespace

bool ScriptValidator::warmUp(std::string& error)
{
    return PythonRuntime::ensureInitialized(error);
}

/**
 * @brief 校验提交的脚本源码
 *
 * 1. 用内嵌解释器的 ast.parse 解析为语法树（不生成字节码、不执行）
 * 2. 查找名为 main 的函数定义
 * 3. main 必须恰好接收一个位置参数，若有注解则必须是 dict 类型
 *
 * @param source 脚本源码（UTF-8）
 * @return ValidationVerdict 校验结论，失败时 message 可直接展示给脚本作者
 */
ValidationVerdict ScriptValidator::validate(const std::string& source)
{
    std::string initError;
    if (!PythonRuntime::ensureInitialized(initError)) {
        return reject(ValidationCode::InternalError, "validation error: " + initError);
    }

    GilGuard gil;

    AstTypes ast;
    std::string error;
    if (!ast.load(error)) {
        Logger::error("ScriptValidator: cannot load ast module: " + error);
        return reject(ValidationCode::InternalError, "validation error: " + error);
    }

    PyObjectPtr text(PyUnicode_DecodeUTF8(source.data(),
                                          static_cast<Py_ssize_t>(source.size()),
                                          "strict"));
    if (!text) {
        PyErr_Clear();
        return reject(ValidationCode::SyntaxInvalid,
                      "invalid Python syntax: source is not valid UTF-8");
    }

    PyObjectPtr filename(PyUnicode_FromString("<script>"));
    PyObjectPtr tree(PyObject_CallFunctionObjArgs(ast.parse.get(), text.get(),
                                                  filename.get(), nullptr));
    if (!tree) {
        if (PyErr_ExceptionMatches(PyExc_SyntaxError)) {
            return reject(ValidationCode::SyntaxInvalid, formatSyntaxError());
        }
        // 源码中含 NUL 字节等情况 ast.parse 抛 ValueError，同样属于无法解析
        if (PyErr_ExceptionMatches(PyExc_ValueError)) {
            return reject(ValidationCode::SyntaxInvalid,
                          "invalid Python syntax: " + fetchPythonError());
        }
        const std::string err = fetchPythonError();
        Logger::error("ScriptValidator: ast.parse failed: " + err);
        return reject(ValidationCode::InternalError, "validation error: " + err);
    }

    PyObjectPtr func = findEntryFunction(tree.get(), ast, error);
    if (!func) {
        if (!error.empty()) {
            return reject(ValidationCode::InternalError, "validation error: " + error);
        }
        return reject(ValidationCode::MissingEntryPoint,
                      "script must define a function 'main' taking one argument of type dict");
    }

    return checkSignature(func.get(), ast);
}

} // namespace scripthub::exec
