#include <iostream>
#include <fstream>
#include <sstream>
#include <string>

#include "ksc/ast_reader.hpp"
#include "ksc/compiler.hpp"

static std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

int main(int argc, char** argv){
    try{
        std::string path, moduleName = "ksc.module";
        for(int i = 1; i < argc; ++i){
            std::string a = argv[i];
            if(a == "--module" && i + 1 < argc){ moduleName = argv[++i]; continue; }
            if(!a.empty() && a[0] == '-' ){ std::cerr << "kscc: unknown option '" << a << "'\n"; return 2; }
            path = a;
        }
        if(path.empty()){
            std::cerr << "usage: kscc <input.edn> [--module <name>]\n";
            return 2;
        }
        std::ifstream f(path, std::ios::binary);
        if(!f){ std::cerr << "kscc: cannot open '" << path << "'\n"; return 2; }
        const auto src = read_all(f);

        ksc::ast::Program prog;
        try {
            prog = ksc::read_program(src);
        } catch(const ksc::parse_error& e){
            std::cerr << path << ":" << e.what() << "\n";
            return 1;
        }

        ksc::Compiler compiler;
        ksc::CompileResult res;
        compiler.compile(prog, res, moduleName);
        for(auto& w: res.warnings){
            std::cerr << w.code << ": warning: " << w.message;
            if(w.line >= 0) std::cerr << " (" << w.line << ":" << w.col << ")";
            std::cerr << "\n";
        }
        if(!res.success){
            for(auto& e: res.errors){
                std::cerr << e.code << ": " << e.message;
                if(e.line >= 0) std::cerr << " (" << path << ":" << e.line << ":" << e.col << ")";
                std::cerr << "\n";
                for(auto& n: e.notes) std::cerr << "  " << n.message << "\n";
                if(!e.hint.empty()) std::cerr << "  hint: " << e.hint << "\n";
            }
            return 1;
        }
        std::cout << compiler.render();
        return 0;
    } catch(const std::exception& e){
        std::cerr << "kscc: exception: " << e.what() << "\n";
        return 1;
    }
}
