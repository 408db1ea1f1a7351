// validation_rules.cpp - Matchers for each RuleKind
#include "security/validation_rules.h"

namespace sandcell::node::security {

namespace {

// Builtins that evaluate or expose arbitrary code and namespaces
const std::set<std::string> kBlockedBuiltins = {
    "eval", "exec", "compile", "globals", "locals", "vars", "breakpoint"
};

// Attributes that walk from an ordinary object back to builtins, frames or code
const std::set<std::string> kEscapeAttributes = {
    "__builtins__", "__globals__", "__subclasses__", "__bases__", "__base__",
    "__mro__", "__code__", "__closure__", "__dict__", "__class__", "__loader__",
    "__spec__", "__getattribute__", "__reduce__", "__reduce_ex__", "__self__",
    "__func__", "__traceback__",
    "tb_frame", "f_globals", "f_builtins", "f_locals", "f_back",
    "gi_frame", "gi_code", "cr_frame", "co_code"
};

const std::set<std::string> kDynamicImportNames = {
    "__import__", "import_module", "reload"
};

const std::set<std::string> kAttributeLookupBuiltins = {
    "getattr", "setattr", "delattr", "hasattr"
};

// operator helpers that look attributes up by string
const std::set<std::string> kLookupFactories = {
    "attrgetter", "methodcaller"
};

// Module handles other modules re-export as plain attributes, e.g. warnings.sys
const std::set<std::string> kModuleHandleAttributes = {
    "os", "sys", "subprocess", "builtins", "importlib", "ctypes", "shutil", "posix",
    "pty", "pickle", "marshal", "runpy"
};

// Dunders ordinary class code needs
const std::set<std::string> kPlainDunders = {
    "__init__", "__name__"
};

// Modules whose .open() opens a file
const std::set<std::string> kOpenerModules = {
    "io", "builtins", "codecs", "gzip", "bz2", "lzma", "tarfile", "zipfile", "os"
};

const std::set<std::string> kPandasReaders = {
    "read_csv", "read_json", "read_parquet", "read_excel", "read_pickle", "read_hdf",
    "read_feather", "read_table", "read_fwf", "read_html", "read_xml", "read_orc",
    "read_stata", "read_sas", "read_spss", "HDFStore"
};

// Writers return a string when called without a path
const std::set<std::string> kPandasWriters = {
    "to_csv", "to_json", "to_parquet", "to_excel", "to_pickle", "to_hdf", "to_feather",
    "to_html", "to_xml", "to_stata", "to_latex", "to_markdown", "to_orc", "ExcelWriter"
};

const std::set<std::string> kNumpyReaders = {
    "load", "loadtxt", "genfromtxt", "fromfile", "fromregex", "memmap"
};

const std::set<std::string> kNumpyWriters = {
    "save", "savez", "savez_compressed", "savetxt"
};

const std::set<std::string> kPathKeywords = {
    "file", "filename", "fname", "path", "path_or_buf", "filepath_or_buffer",
    "io", "excel_writer", "buf", "fid"
};

enum class FileCall {
    None,
    Open,
    Reader,
    Writer
};

std::string RootModule(const std::string& dotted) {
    return dotted.substr(0, dotted.find('.'));
}

std::string TerminalName(const py::handle& node, const AstClasses& ast) {
    if (py::isinstance(node, ast.Name)) {
        return node.attr("id").cast<std::string>();
    }
    if (py::isinstance(node, ast.Attribute)) {
        return node.attr("attr").cast<std::string>();
    }
    return "";
}

std::string AttributeBase(const py::handle& node, const AstClasses& ast) {
    return DottedName(node.attr("value"), ast);
}

// ---- BlockedImport ----

void CheckImportedModule(const std::string& module, const py::handle& node, RuleContext& ctx) {
    std::string root = RootModule(module);
    if (GetNetworkModules().count(root)) {
        return;  // NetworkReference owns these
    }
    if (GetAlwaysBlockedModules().count(root) || !ctx.allowed_modules.count(root)) {
        ctx.Report(RuleKind::BlockedImport, "import of '" + module + "' is not allowed", node);
    }
}

void MatchBlockedImport(const py::handle& node, RuleContext& ctx) {
    if (py::isinstance(node, ctx.ast.Import)) {
        for (auto alias : node.attr("names")) {
            CheckImportedModule(alias.attr("name").cast<std::string>(), node, ctx);
        }
        return;
    }

    if (py::isinstance(node, ctx.ast.ImportFrom)) {
        py::object level = node.attr("level");
        if (!level.is_none() && level.cast<int>() > 0) {
            ctx.Report(RuleKind::BlockedImport, "relative imports are not allowed", node);
            return;
        }
        py::object module = node.attr("module");
        if (module.is_none()) {
            ctx.Report(RuleKind::BlockedImport, "import without a module name is not allowed", node);
            return;
        }
        CheckImportedModule(module.cast<std::string>(), node, ctx);
    }
}

// ---- BlockedCall ----

bool IsPrivateName(const std::string& name) {
    return !name.empty() && name[0] == '_' && !kPlainDunders.count(name);
}

bool IsFileCallName(const std::string& name) {
    return name == "open" || name == "tofile" || kPandasReaders.count(name) ||
           kPandasWriters.count(name) || kNumpyReaders.count(name) || kNumpyWriters.count(name);
}

// An attribute name looked up by string must be a literal that plain dotted access could use
bool IsForbiddenLookup(const std::string& attr) {
    return attr.empty() || attr[0] == '_' || kBlockedBuiltins.count(attr) ||
           kEscapeAttributes.count(attr) || kDynamicImportNames.count(attr) ||
           kModuleHandleAttributes.count(attr) || IsFileCallName(attr);
}

void CheckLookupArgument(const std::string& callee, const py::handle& arg,
                         const py::handle& call, RuleContext& ctx) {
    if (!py::isinstance(arg, ctx.ast.Constant) ||
        !py::isinstance<py::str>(arg.attr("value"))) {
        ctx.Report(RuleKind::BlockedCall, callee + "() with a computed attribute name is not allowed", call);
        return;
    }

    // attrgetter accepts dotted paths
    std::string path = arg.attr("value").cast<std::string>();
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (IsForbiddenLookup(part)) {
            ctx.Report(RuleKind::BlockedCall, callee + "() of '" + path + "' is not allowed", call);
            return;
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
}

void CheckAttributeLookup(const py::handle& call, RuleContext& ctx) {
    py::object func = call.attr("func");
    std::string callee = TerminalName(func, ctx.ast);
    py::list args = call.attr("args");

    if (py::isinstance(func, ctx.ast.Name) && kAttributeLookupBuiltins.count(callee)) {
        if (args.size() < 2) {
            ctx.Report(RuleKind::BlockedCall, callee + "() needs a literal attribute name", call);
            return;
        }
        py::object name_arg = args[1];
        CheckLookupArgument(callee, name_arg, call, ctx);
        return;
    }

    if (!kLookupFactories.count(callee)) return;

    if (args.size() == 0) {
        ctx.Report(RuleKind::BlockedCall, callee + "() needs a literal attribute name", call);
        return;
    }
    if (callee == "methodcaller") {
        py::object name_arg = args[0];
        CheckLookupArgument(callee, name_arg, call, ctx);
        return;
    }
    for (auto arg : args) {
        CheckLookupArgument(callee, arg, call, ctx);
    }
}

void CheckImportedNames(const py::handle& node, RuleContext& ctx) {
    for (auto alias : node.attr("names")) {
        std::string name = alias.attr("name").cast<std::string>();
        if (IsPrivateName(name)) {
            ctx.Report(RuleKind::BlockedCall, "import of private name '" + name + "' is not allowed", node);
        } else if (kModuleHandleAttributes.count(name)) {
            ctx.Report(RuleKind::BlockedCall, "import of module handle '" + name + "' is not allowed", node);
        } else if ((kAttributeLookupBuiltins.count(name) || kLookupFactories.count(name)) &&
                   !alias.attr("asname").is_none()) {
            ctx.Report(RuleKind::BlockedCall, "renaming '" + name + "' on import is not allowed", node);
        }
    }
}

void MatchBlockedCall(const py::handle& node, RuleContext& ctx) {
    if (py::isinstance(node, ctx.ast.Call)) {
        CheckAttributeLookup(node, ctx);
        return;
    }

    if (py::isinstance(node, ctx.ast.ImportFrom)) {
        CheckImportedNames(node, ctx);
        return;
    }

    if (py::isinstance(node, ctx.ast.Name)) {
        std::string id = node.attr("id").cast<std::string>();
        if (kBlockedBuiltins.count(id)) {
            ctx.Report(RuleKind::BlockedCall, "use of '" + id + "' is not allowed", node);
        } else if (kEscapeAttributes.count(id)) {
            ctx.Report(RuleKind::BlockedCall, "access to '" + id + "' is not allowed", node);
        } else if ((kAttributeLookupBuiltins.count(id) || kLookupFactories.count(id)) &&
                   !ctx.IsCallee(node)) {
            // A renamed lookup helper escapes the literal-name check
            ctx.Report(RuleKind::BlockedCall, "indirect reference to '" + id + "' is not allowed", node);
        }
        return;
    }

    if (py::isinstance(node, ctx.ast.Attribute)) {
        std::string attr = node.attr("attr").cast<std::string>();
        if (attr == "eval" || attr == "exec") {
            ctx.Report(RuleKind::BlockedCall, "use of '." + attr + "' is not allowed", node);
        } else if (attr == "compile" && AttributeBase(node, ctx.ast) != "re") {
            ctx.Report(RuleKind::BlockedCall, "use of '.compile' is not allowed", node);
        } else if (kEscapeAttributes.count(attr)) {
            ctx.Report(RuleKind::BlockedCall, "access to '" + attr + "' is not allowed", node);
        } else if (kModuleHandleAttributes.count(attr)) {
            ctx.Report(RuleKind::BlockedCall, "access to module handle '" + attr + "' is not allowed", node);
        } else if (IsPrivateName(attr)) {
            // Modules keep private handles on os and sys (random._os, collections._sys)
            ctx.Report(RuleKind::BlockedCall, "access to private attribute '" + attr + "' is not allowed", node);
        } else if (kLookupFactories.count(attr) && !ctx.IsCallee(node)) {
            ctx.Report(RuleKind::BlockedCall, "indirect reference to '" + attr + "' is not allowed", node);
        }
    }
}

// ---- DynamicImport ----

void MatchDynamicImport(const py::handle& node, RuleContext& ctx) {
    if (!py::isinstance(node, ctx.ast.Name) && !py::isinstance(node, ctx.ast.Attribute)) {
        return;
    }
    std::string name = TerminalName(node, ctx.ast);
    if (kDynamicImportNames.count(name)) {
        ctx.Report(RuleKind::DynamicImport, "dynamic import via '" + name + "' is not allowed", node);
    }
}

// ---- DisallowedFileAccess ----

FileCall ClassifyFileCall(const py::handle& func, const AstClasses& ast) {
    if (py::isinstance(func, ast.Name)) {
        std::string id = func.attr("id").cast<std::string>();
        if (id == "open") return FileCall::Open;
        if (kPandasReaders.count(id)) return FileCall::Reader;
        return FileCall::None;
    }

    if (!py::isinstance(func, ast.Attribute)) {
        return FileCall::None;
    }

    std::string attr = func.attr("attr").cast<std::string>();
    std::string base = AttributeBase(func, ast);

    if (attr == "open" && kOpenerModules.count(RootModule(base))) return FileCall::Open;
    if (kPandasReaders.count(attr)) return FileCall::Reader;
    if (kPandasWriters.count(attr)) return FileCall::Writer;
    if (attr == "tofile") return FileCall::Open;
    if (base == "np" || base == "numpy") {
        if (kNumpyReaders.count(attr) || kNumpyWriters.count(attr)) return FileCall::Open;
    }
    return FileCall::None;
}

// The expression naming the file, or None if the call names no file at all
py::object FindPathArgument(const py::handle& call) {
    for (auto keyword : call.attr("keywords")) {
        py::object arg = keyword.attr("arg");
        // **kwargs could carry anything
        if (arg.is_none() || kPathKeywords.count(arg.cast<std::string>())) {
            return keyword.attr("value");
        }
    }
    py::list args = call.attr("args");
    if (args.size() > 0) {
        py::object first = args[0];
        return first;
    }
    return py::none();
}

bool IsScratchLiteral(const py::handle& expr, const RuleContext& ctx) {
    if (!py::isinstance(expr, ctx.ast.Constant)) return false;
    py::object value = expr.attr("value");
    if (!py::isinstance<py::str>(value)) return false;

    std::string path = value.cast<std::string>();
    if (path.rfind(ctx.scratch_prefix, 0) != 0) return false;
    if (path.find("..") != std::string::npos) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

void MatchFileAccess(const py::handle& node, RuleContext& ctx) {
    if (py::isinstance(node, ctx.ast.Call)) {
        py::object func = node.attr("func");
        FileCall kind = ClassifyFileCall(func, ctx.ast);
        if (kind == FileCall::None) return;

        std::string callee = DottedName(func, ctx.ast);
        py::object path = FindPathArgument(node);
        if (path.is_none()) {
            if (kind != FileCall::Writer) {
                ctx.Report(RuleKind::DisallowedFileAccess,
                           callee + "() needs a literal path under " + ctx.scratch_prefix, node);
            }
            return;
        }
        if (!IsScratchLiteral(path, ctx)) {
            ctx.Report(RuleKind::DisallowedFileAccess,
                       callee + "() path must be a string literal under " + ctx.scratch_prefix, node);
        }
        return;
    }

    // open passed around instead of called escapes the path check
    if (py::isinstance(node, ctx.ast.Name) && node.attr("id").cast<std::string>() == "open" &&
        !ctx.IsCallee(node)) {
        ctx.Report(RuleKind::DisallowedFileAccess, "indirect reference to 'open' is not allowed", node);
    }
}

// ---- NetworkReference ----

void MatchNetworkReference(const py::handle& node, RuleContext& ctx) {
    const auto& modules = GetNetworkModules();
    const auto& names = GetNetworkNames();

    if (py::isinstance(node, ctx.ast.Import)) {
        for (auto alias : node.attr("names")) {
            std::string module = alias.attr("name").cast<std::string>();
            if (modules.count(RootModule(module))) {
                ctx.Report(RuleKind::NetworkReference, "import of networking module '" + module + "'", node);
            }
        }
        return;
    }

    if (py::isinstance(node, ctx.ast.ImportFrom)) {
        py::object module = node.attr("module");
        if (!module.is_none() && modules.count(RootModule(module.cast<std::string>()))) {
            ctx.Report(RuleKind::NetworkReference,
                       "import of networking module '" + module.cast<std::string>() + "'", node);
            return;
        }
        for (auto alias : node.attr("names")) {
            std::string name = alias.attr("name").cast<std::string>();
            if (names.count(name)) {
                ctx.Report(RuleKind::NetworkReference, "import of networking primitive '" + name + "'", node);
            }
        }
        return;
    }

    if (py::isinstance(node, ctx.ast.Name) || py::isinstance(node, ctx.ast.Attribute)) {
        std::string name = TerminalName(node, ctx.ast);
        if (names.count(name)) {
            ctx.Report(RuleKind::NetworkReference, "reference to networking primitive '" + name + "'", node);
        }
    }
}

} // namespace

AstClasses AstClasses::Resolve(const py::module_& ast) {
    AstClasses classes;
    classes.Import = ast.attr("Import");
    classes.ImportFrom = ast.attr("ImportFrom");
    classes.Call = ast.attr("Call");
    classes.Name = ast.attr("Name");
    classes.Attribute = ast.attr("Attribute");
    classes.Constant = ast.attr("Constant");
    return classes;
}

RuleContext::RuleContext(const AstClasses& ast_classes,
                         const std::set<std::string>& allowed,
                         const std::string& prefix)
    : ast(ast_classes), allowed_modules(allowed), scratch_prefix(prefix) {}

bool RuleContext::IsCallee(const py::handle& node) const {
    return callees.count(node.ptr()) > 0;
}

void RuleContext::Report(RuleKind kind, std::string message, const py::handle& node) {
    ValidationError error;
    error.rule_kind = kind;
    error.message = std::move(message);

    py::object lineno = py::getattr(node, "lineno", py::none());
    if (!lineno.is_none()) {
        error.line = lineno.cast<int>();
    }
    py::object col = py::getattr(node, "col_offset", py::none());
    if (!col.is_none()) {
        error.column = col.cast<int>() + 1;
    }
    errors_.push_back(std::move(error));
}

std::string DottedName(const py::handle& node, const AstClasses& ast) {
    if (py::isinstance(node, ast.Name)) {
        return node.attr("id").cast<std::string>();
    }
    if (py::isinstance(node, ast.Attribute)) {
        std::string base = DottedName(node.attr("value"), ast);
        if (base.empty()) return "";
        return base + "." + node.attr("attr").cast<std::string>();
    }
    return "";
}

const std::set<std::string>& GetAlwaysBlockedModules() {
    static const std::set<std::string> modules = {
        "os", "sys", "subprocess", "importlib", "builtins", "ctypes", "cffi", "shutil",
        "pathlib", "glob", "io", "tempfile", "pickle", "marshal", "shelve", "dill",
        "multiprocessing", "threading", "concurrent", "signal", "resource", "gc",
        "inspect", "code", "codeop", "types", "runpy", "pty", "fcntl", "posix", "mmap",
        "pdb", "platform", "sysconfig", "site", "zipimport", "pkgutil"
    };
    return modules;
}

const std::set<std::string>& GetNetworkModules() {
    static const std::set<std::string> modules = {
        "socket", "ssl", "urllib", "urllib2", "urllib3", "requests", "http", "httplib",
        "httpx", "aiohttp", "ftplib", "smtplib", "poplib", "imaplib", "nntplib", "telnetlib",
        "asyncio", "socketserver", "xmlrpc", "websocket", "websockets", "select", "selectors",
        "paramiko", "webbrowser", "smtpd"
    };
    return modules;
}

const std::set<std::string>& GetNetworkNames() {
    static const std::set<std::string> names = {
        "socket", "socketpair", "create_connection", "create_server", "fromfd",
        "getaddrinfo", "gethostbyname", "urlopen", "urlretrieve", "build_opener",
        "HTTPConnection", "HTTPSConnection", "open_connection", "start_server"
    };
    return names;
}

const std::vector<ValidationRule>& GetValidationRules() {
    static const std::vector<ValidationRule> rules = {
        {RuleKind::BlockedImport, "blocked-import", MatchBlockedImport},
        {RuleKind::NetworkReference, "network-reference", MatchNetworkReference},
        {RuleKind::BlockedCall, "blocked-call", MatchBlockedCall},
        {RuleKind::DynamicImport, "dynamic-import", MatchDynamicImport},
        {RuleKind::DisallowedFileAccess, "file-access", MatchFileAccess},
    };
    return rules;
}

} // namespace sandcell::node::security
