#include "builtin_exporters.hpp"

#include <array>

namespace tincture::detail
{

namespace
{

constexpr std::string_view VIM = R"TOML(
name = "vim"
path = "colors/tincture.vim"

extras = { CONSTANT = 3, IDENTIFIER = 6, STATEMENT = 4, PREPROC = 2, TYPE = 5, SPECIAL = 10, UNDERLINED = 11, ERROR = 1, TODO = 9 }

formatter = '''
hi clear
if exists("syntax_on")
  syn reset
endif
set background=dark
let g:colors_name = "{NAME}"

let s:fg = '#{HEX15}'
let s:bg = '#{HEX0}'
let s:fga = '#{HEX7}'
let s:bga = '#{HEX8}'
let s:ac = '#{ACCHEX}'
let s:constant = '#{CONSTANTHEX}'
let s:identifier = '#{IDENTIFIERHEX}'
let s:statement = '#{STATEMENTHEX}'
let s:preproc = '#{PREPROCHEX}'
let s:type = '#{TYPEHEX}'
let s:special = '#{SPECIALHEX}'
let s:underlined = '#{UNDERLINEDHEX}'
let s:error = '#{ERRORHEX}'
let s:todo = '#{TODOHEX}'

exe 'hi Normal guifg='.s:fg.' guibg='.s:bg
exe 'hi NormalFloat guifg='.s:fg.' guibg='.s:bga
exe 'hi NormalNC guifg='.s:fga
exe 'hi Cursor guifg='.s:bg.' guibg='.s:ac
exe 'hi CursorLineNr guifg='.s:ac
hi! link LineNr NormalNC
hi! link NonText LineNr
exe 'hi Visual guifg='.s:bg.' guibg='.s:fga
exe 'hi Search guifg='.s:bg.' guibg='.s:identifier
exe 'hi IncSearch guifg='.s:bg.' guibg='.s:type.' gui=NONE'
exe 'hi Folded guifg='.s:bga.' guibg='.s:fga
exe 'hi SignColumn guibg='.s:bga
exe 'hi Comment guifg='.s:fga

exe 'hi Constant guifg='.s:constant
exe 'hi Identifier guifg='.s:identifier
exe 'hi Statement guifg='.s:statement
exe 'hi PreProc guifg='.s:preproc
exe 'hi Type guifg='.s:type
exe 'hi Special guifg='.s:special.' gui=bold'
exe 'hi Underlined guifg='.s:underlined.' guisp='.s:underlined
exe 'hi Error guifg='.s:error.' guibg=NONE gui=bold'
exe 'hi Todo guifg='.s:todo.' guibg=NONE gui=bold'

hi! link ErrorMsg Error
hi! link WarningMsg Special
hi! link Title Type
hi! link MoreMsg Identifier
hi! link Pmenu NormalFloat
hi! link PmenuSel Cursor
exe 'hi PmenuThumb guibg='.s:fga
'''
)TOML";

constexpr std::string_view KITTY = R"TOML(
name = "kitty"
path = "kitty/tincture.conf"

formatter = '''
# {NAME}
foreground            #{HEX15}
background            #{HEX0}
selection_foreground  #{HEX0}
selection_background  #{HEX7}
cursor                #{ACCHEX}
cursor_text_color     #{HEX0}
url_color             #{ACCHEX}
active_border_color   #{ACCHEX}
inactive_border_color #{HEX8}
active_tab_foreground   #{HEX0}
active_tab_background   #{ACCHEX}
inactive_tab_foreground #{HEX7}
inactive_tab_background #{HEX8}

color0  #{HEX0}
color1  #{HEX1}
color2  #{HEX2}
color3  #{HEX3}
color4  #{HEX4}
color5  #{HEX5}
color6  #{HEX6}
color7  #{HEX7}
color8  #{HEX8}
color9  #{HEX9}
color10 #{HEX10}
color11 #{HEX11}
color12 #{HEX12}
color13 #{HEX13}
color14 #{HEX14}
color15 #{HEX15}
'''
)TOML";

constexpr std::string_view ALACRITTY = R"TOML(
name = "alacritty"
path = "alacritty/tincture.toml"

formatter = '''
# {NAME}
[colors.primary]
foreground = "#{HEX15}"
background = "#{HEX0}"

[colors.cursor]
text = "#{HEX0}"
cursor = "#{ACCHEX}"

[colors.selection]
text = "#{HEX0}"
background = "#{HEX7}"

[colors.normal]
black = "#{HEX0}"
red = "#{HEX1}"
green = "#{HEX2}"
yellow = "#{HEX3}"
blue = "#{HEX4}"
magenta = "#{HEX5}"
cyan = "#{HEX6}"
white = "#{HEX7}"

[colors.bright]
black = "#{HEX8}"
red = "#{HEX9}"
green = "#{HEX10}"
yellow = "#{HEX11}"
blue = "#{HEX12}"
magenta = "#{HEX13}"
cyan = "#{HEX14}"
white = "#{HEX15}"
'''
)TOML";

constexpr std::string_view FOOT = R"TOML(
name = "foot"
path = "foot/tincture.ini"

formatter = '''
# {NAME}
[cursor]
color={HEX0} {ACCHEX}

[colors]
foreground={HEX15}
background={HEX0}
selection-foreground={HEX0}
selection-background={HEX7}
regular0={HEX0}
regular1={HEX1}
regular2={HEX2}
regular3={HEX3}
regular4={HEX4}
regular5={HEX5}
regular6={HEX6}
regular7={HEX7}
bright0={HEX8}
bright1={HEX9}
bright2={HEX10}
bright3={HEX11}
bright4={HEX12}
bright5={HEX13}
bright6={HEX14}
bright7={HEX15}
'''
)TOML";

constexpr std::string_view DUNST = R"TOML(
name = "dunst"
path = "dunst/dunstrc.d/tincture.conf"

extras = { CRITICAL = 1 }

formatter = '''
# {NAME}
[global]
frame_color = "#{ACCHEX}"
separator_color = frame
highlight = "#{ACCHEX}"

[urgency_low]
background = "#{HEX0}"
foreground = "#{HEX7}"
frame_color = "#{HEX8}"

[urgency_normal]
background = "#{HEX0}"
foreground = "#{HEX15}"
frame_color = "#{ACCHEX}"

[urgency_critical]
background = "#{HEX0}"
foreground = "#{HEX15}"
frame_color = "#{CRITICALHEX}"
'''
)TOML";

constexpr std::string_view I3 = R"TOML(
name = "i3"
path = "i3/tincture.conf"

extras = { URGENT = 1 }

formatter = '''
# {NAME}
# class                 border     background text       indicator  child_border
client.focused          #{ACCHEX} #{ACCHEX} #{HEX0} #{HEX15} #{ACCHEX}
client.focused_inactive #{HEX8} #{HEX8} #{HEX15} #{HEX8} #{HEX8}
client.unfocused        #{HEX0} #{HEX0} #{HEX7} #{HEX0} #{HEX0}
client.urgent           #{URGENTHEX} #{URGENTHEX} #{HEX0} #{URGENTHEX} #{URGENTHEX}
client.placeholder      #{HEX0} #{HEX0} #{HEX15} #{HEX0} #{HEX0}
client.background       #{HEX0}

bar {
    colors {
        background #{HEX0}
        statusline #{HEX15}
        separator  #{HEX8}
        focused_workspace  #{ACCHEX} #{ACCHEX} #{HEX0}
        active_workspace   #{HEX8} #{HEX8} #{HEX15}
        inactive_workspace #{HEX0} #{HEX0} #{HEX7}
        urgent_workspace   #{URGENTHEX} #{URGENTHEX} #{HEX0}
    }
}
'''
)TOML";

constexpr std::array<BuiltinExporter, 6> BUILTINS = {{
    {"vim", VIM},
    {"kitty", KITTY},
    {"alacritty", ALACRITTY},
    {"foot", FOOT},
    {"dunst", DUNST},
    {"i3", I3},
}};

}   // namespace

std::span<const BuiltinExporter> builtin_exporters()
{
    return BUILTINS;
}

}   // namespace tincture::detail
