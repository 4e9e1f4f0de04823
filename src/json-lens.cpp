#include "json_diff_render.hpp"
#include "json_lens_settings.hpp"
#include "json_search.hpp"
#include "json_tree.hpp"
#include "json_value.hpp"

#include <algorithm>
#include <clocale>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <wchar.h>

// Gutter characters for the side-by-side output
namespace GutterMarks
{
    constexpr const char *ADDED = "+";
    constexpr const char *REMOVED = "-";
    constexpr const char *MODIFIED = "~";
    constexpr const char *UNCHANGED = " ";
    constexpr const char *SEPARATOR = " │ ";
}

static bool verbose = false;

static void logStage(const std::string &message)
{
    if (verbose)
        std::cerr << "json-lens: " << message << std::endl;
}

// Display width of a UTF-8 string in terminal columns
static int getDisplayWidth(const std::string &str)
{
    std::vector<wchar_t> wstr(str.length() + 1);
    size_t result = mbstowcs(wstr.data(), str.c_str(), str.length());
    if (result == (size_t)-1)
    {
        // Conversion failed, fall back to byte length
        return static_cast<int>(str.length());
    }
    int width = wcswidth(wstr.data(), result);
    // wcswidth returns -1 for unprintable characters
    return (width >= 0) ? width : static_cast<int>(str.length());
}

static void showUsage(const char *progName)
{
    std::cout << "json-lens - JSON tree, search and structural comparison tool\n\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << progName << " [--config FILE] [--verbose] COMMAND [options] ...\n\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  tree [--depth N] [--all] [--find QUERY] FILE\n";
    std::cout << "            Print the document as a tree folded at depth N\n";
    std::cout << "  search [--raw] QUERY FILE\n";
    std::cout << "            Count and list the elements whose key or value contains QUERY\n";
    std::cout << "  diff [--ignore-array-order] [--loose-types] LEFT RIGHT\n";
    std::cout << "            Print the differences as JSON; exits 1 when the documents differ\n";
    std::cout << "  compare [--ignore-array-order] [--loose-types] [--context N] [--full] LEFT RIGHT\n";
    std::cout << "            Print both documents side by side with +, - and ~ gutters\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  --config FILE  Read settings from a JSON file\n";
    std::cout << "  --verbose      Report each processing stage on stderr\n";
    std::cout << "  -h, --help     Show this help message\n";
    std::cout << "  --version      Show version information\n\n";
    std::cout << "A file name of - reads standard input.\n\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << progName << " tree --depth 1 config.json\n";
    std::cout << "  cat data.json | " << progName << " search alice -\n";
    std::cout << "  " << progName << " compare --ignore-array-order old.json new.json\n";
}

static std::string readInput(const std::string &name)
{
    if (name == "-")
    {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return ss.str();
    }
    return readTextFile(name);
}

static std::shared_ptr<const json> loadDocument(const std::string &name)
{
    std::string contents = readInput(name);
    logStage("read " + std::to_string(contents.size()) + " bytes from " +
             (name == "-" ? std::string("(stdin)") : name));
    auto doc = std::make_shared<const json>(parseJsonWithSpecialNumbers(contents));
    logStage("parsed " + name + " as " + typeDescription(*doc));
    return doc;
}

static int parseCount(const std::string &text, const char *option)
{
    char *end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || value < 0 || value > 1000000)
        throw std::runtime_error(std::string("invalid value for ") + option + ": " + text);
    return static_cast<int>(value);
}

// Value of an option that takes an argument
static const std::string &optionValue(const std::vector<std::string> &args, size_t &i,
                                      const char *option)
{
    if (i + 1 >= args.size())
        throw std::runtime_error(std::string("missing value for ") + option);
    return args[++i];
}

static void requireOperands(const std::vector<std::string> &operands, size_t count,
                            const char *command)
{
    if (operands.size() != count)
        throw std::runtime_error(std::string(command) + " expects " + std::to_string(count) +
                                 (count == 1 ? " file" : " operands") + ", got " +
                                 std::to_string(operands.size()));
}

static bool isOption(const std::string &arg)
{
    return arg.size() > 1 && arg[0] == '-';
}

// Path from the root to `node` as display keys, e.g. root > users > [0]
static std::string nodeTrail(const TreeNode *node)
{
    std::string trail = node->displayKey();
    for (const TreeNode *cur = node->parent(); cur != nullptr; cur = cur->parent())
    {
        trail = cur->displayKey() + " > " + trail;
    }
    return trail;
}

static int runTree(const std::vector<std::string> &args, const LensSettings &settings)
{
    int depth = settings.defaultFoldDepth;
    bool all = false;
    std::string query;
    std::vector<std::string> operands;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const char *arg = args[i].c_str();
        if (strcmp(arg, "--depth") == 0)
            depth = parseCount(optionValue(args, i, "--depth"), "--depth");
        else if (strcmp(arg, "--all") == 0)
            all = true;
        else if (strcmp(arg, "--find") == 0)
            query = optionValue(args, i, "--find");
        else if (isOption(args[i]))
            throw std::runtime_error(std::string("unknown tree option: ") + arg);
        else
            operands.push_back(args[i]);
    }
    requireOperands(operands, 1, "tree");

    std::unique_ptr<TreeNode> root = TreeNode::from(loadDocument(operands[0]), depth);
    if (all)
        root->expandAll();

    // Reveal every match so it shows up in the printed tree
    SearchState search;
    search.term = query;
    search.ignoreEscapeSequences = settings.ignoreEscapeSequences;
    runSearch(*root, search);
    for (size_t n = 0; n < search.matches.size(); ++n)
    {
        revealCurrentMatch(*root, search);
        stepSearch(search, 1);
    }
    if (!query.empty())
        logStage(std::to_string(search.matches.size()) + " occurrences of \"" + query + "\"");

    std::string lowerQuery = toLowerAscii(query);
    std::vector<TreeNode *> visible = root->allNodes();
    logStage(std::to_string(visible.size()) + " visible nodes");
    for (TreeNode *node : visible)
    {
        std::string indicator = "  ";
        if (isContainer(node->value()) && !node->value().empty())
            indicator = node->isExpanded() ? "▼ " : "▶ ";
        std::cout << connectorPrefix(node) << indicator << nodeLabel(node);
        if (node->matches(lowerQuery, settings.ignoreEscapeSequences))
            std::cout << "  *";
        std::cout << "\n";
    }
    return 0;
}

static int runSearchCommand(const std::vector<std::string> &args, const LensSettings &settings)
{
    bool raw = settings.ignoreEscapeSequences;
    std::vector<std::string> operands;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const char *arg = args[i].c_str();
        if (strcmp(arg, "--raw") == 0)
            raw = true;
        else if (isOption(args[i]))
            throw std::runtime_error(std::string("unknown search option: ") + arg);
        else
            operands.push_back(args[i]);
    }
    requireOperands(operands, 2, "search");
    const std::string &query = operands[0];

    std::unique_ptr<TreeNode> root = TreeNode::from(loadDocument(operands[1]),
                                                    settings.defaultFoldDepth);
    size_t matchCount = countMatches(root->value(), root->key(), query, raw);
    size_t occurrenceCount = countOccurrences(root->value(), root->key(), query, raw);
    std::cout << matchCount << (matchCount == 1 ? " match, " : " matches, ") << occurrenceCount
              << (occurrenceCount == 1 ? " occurrence" : " occurrences") << "\n";

    std::vector<MatchPath> paths = searchMatchPaths(root->value(), root->key(), query, raw);
    for (const MatchPath &path : paths)
    {
        TreeNode *node = root->nodeAt(path);
        if (node == nullptr)
            continue;
        std::string label = nodeLabel(node);
        std::cout << nodeTrail(node) << label.substr(node->displayKey().size()) << "\n";
    }
    return 0;
}

// Shared option parsing of diff and compare.  Returns true when the
// argument was consumed.
static bool parseCompareOption(const std::vector<std::string> &args, size_t &i,
                               LensSettings &settings)
{
    const char *arg = args[i].c_str();
    if (strcmp(arg, "--ignore-array-order") == 0)
        settings.compare.ignoreArrayOrder = true;
    else if (strcmp(arg, "--loose-types") == 0)
        settings.compare.strictType = false;
    else
        return false;
    return true;
}

static void logSummary(const CompareDiffResult &diff)
{
    if (diff.isIdentical())
    {
        std::cerr << "Documents are identical" << std::endl;
        return;
    }
    std::cerr << diff.totalDiffCount() << " differences: " << diff.addedCount() << " added, "
              << diff.removedCount() << " removed, " << diff.modifiedCount() << " modified"
              << std::endl;
}

static int runDiff(const std::vector<std::string> &args, LensSettings settings)
{
    std::vector<std::string> operands;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (parseCompareOption(args, i, settings))
            continue;
        if (isOption(args[i]))
            throw std::runtime_error("unknown diff option: " + args[i]);
        operands.push_back(args[i]);
    }
    requireOperands(operands, 2, "diff");

    CompareDiffResult diff = compareJson(loadDocument(operands[0]), loadDocument(operands[1]),
                                         settings.compare);
    logStage("compared documents");
    std::cout << toJsonString(diff.serializeDiff(), true, settings.indentSize) << "\n";
    logSummary(diff);
    return diff.isIdentical() ? 0 : 1;
}

static const char *gutterFor(const RenderLine &line)
{
    if (line.kind != RenderLineKind::Content)
        return GutterMarks::UNCHANGED;
    switch (line.diffType)
    {
    case DiffType::Added:
        return GutterMarks::ADDED;
    case DiffType::Removed:
        return GutterMarks::REMOVED;
    case DiffType::Modified:
        return GutterMarks::MODIFIED;
    default:
        return GutterMarks::UNCHANGED;
    }
}

static int runCompare(const std::vector<std::string> &args, LensSettings settings)
{
    bool collapse = true;
    std::vector<std::string> operands;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const char *arg = args[i].c_str();
        if (parseCompareOption(args, i, settings))
            continue;
        if (strcmp(arg, "--context") == 0)
            settings.collapseContext = parseCount(optionValue(args, i, "--context"), "--context");
        else if (strcmp(arg, "--full") == 0)
            collapse = false;
        else if (isOption(args[i]))
            throw std::runtime_error(std::string("unknown compare option: ") + arg);
        else
            operands.push_back(args[i]);
    }
    requireOperands(operands, 2, "compare");

    CompareDiffResult diff = compareJson(loadDocument(operands[0]), loadDocument(operands[1]),
                                         settings.compare);
    logStage("compared documents");
    CompareRenderResult rendered =
        buildRenderResult(toJsonString(diff.left(), true, settings.indentSize),
                          toJsonString(diff.right(), true, settings.indentSize), diff);

    SideBySideOptions options;
    options.collapseUnchanged = collapse;
    options.collapseContext = settings.collapseContext;
    options.maxDisplayLines = settings.maxDisplayLines;
    SideBySideView view = buildSideBySide(rendered, options);
    logStage(std::to_string(view.left.size()) + " rows, " +
             std::to_string(view.diffLocations.size()) + " with differences");

    int leftWidth = 0;
    for (const RenderLine &line : view.left)
    {
        leftWidth = std::max(leftWidth, getDisplayWidth(line.text));
    }
    for (size_t i = 0; i < view.left.size(); ++i)
    {
        const RenderLine &left = view.left[i];
        const RenderLine &right = view.right[i];
        if (left.kind == RenderLineKind::Collapse)
        {
            std::cout << "  " << left.text << "\n";
            continue;
        }
        int pad = leftWidth - getDisplayWidth(left.text);
        std::cout << gutterFor(left) << " " << left.text << std::string(pad, ' ')
                  << GutterMarks::SEPARATOR << gutterFor(right) << " " << right.text << "\n";
    }
    if (view.truncated)
        std::cerr << "Output truncated at " << settings.maxDisplayLines << " lines" << std::endl;
    logSummary(diff);
    return 0;
}

int main(int argc, char **argv)
{
    // Enable UTF-8 locale for display width calculations
    setlocale(LC_ALL, "");

    // Check for help or version flags
    for (int i = 1; i < argc; ++i)
    {
        const char *arg = argv[i];
        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0)
        {
            showUsage(argv[0]);
            return 0;
        }
        if (strcmp(arg, "--version") == 0)
        {
            std::cout << "json-lens version 1.0\n";
            std::cout << "Built on " << __DATE__ << " " << __TIME__ << "\n";
            return 0;
        }
    }

    LensSettings settings;
    int i = 1;
    for (; i < argc; ++i)
    {
        const char *arg = argv[i];
        if (strcmp(arg, "--verbose") == 0)
        {
            verbose = true;
        }
        else if (strcmp(arg, "--config") == 0)
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for --config" << std::endl;
                return 1;
            }
            const char *path = argv[++i];
            try
            {
                settings = loadSettings(path);
                logStage(std::string("loaded settings from ") + path);
            }
            catch (const std::exception &ex)
            {
                std::cerr << "Error loading settings from " << path << ": " << ex.what()
                          << std::endl;
                return 1;
            }
        }
        else if (isOption(arg))
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        }
        else
        {
            break;
        }
    }

    if (i >= argc)
    {
        showUsage(argv[0]);
        return 1;
    }

    std::string command = argv[i];
    std::vector<std::string> args(argv + i + 1, argv + argc);
    try
    {
        if (command == "tree")
            return runTree(args, settings);
        if (command == "search")
            return runSearchCommand(args, settings);
        if (command == "diff")
            return runDiff(args, settings);
        if (command == "compare")
            return runCompare(args, settings);
        std::cerr << "Unknown command: " << command << std::endl;
        return 1;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error in " << command << ": " << ex.what() << std::endl;
        // diff reserves 1 for "documents differ"
        return command == "diff" ? 2 : 1;
    }
}
